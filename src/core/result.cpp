#include <mcp_echo/core/result.hpp>

#include <cstring>

namespace mcp_echo {

Error Error::FromErrno(const std::string& operation,
                       const std::string& message, int err) {
    return Error{operation,
                 message + ": " + std::strerror(err),
                 ErrorCategory::Transport,
                 err};
}

} // namespace mcp_echo
