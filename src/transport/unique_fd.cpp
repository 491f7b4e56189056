#include <mcp_echo/transport/unique_fd.hpp>

#include <unistd.h>

namespace mcp_echo {

void UniqueFd::Reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

} // namespace mcp_echo
