#pragma once

#include <mcp_echo/mcp/dispatcher.hpp>

#include <cstddef>
#include <iostream>

namespace mcp_echo {

// ---------------------------------------------------------------------------
// StdioServer: MCP over stdin/stdout, one JSON-RPC message per line.
// Single-threaded: each line is fully answered before the next is read.
// ---------------------------------------------------------------------------
class StdioServer {
public:
    explicit StdioServer(const McpDispatcher& dispatcher,
                         std::istream& in = std::cin,
                         std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream or until
    // the output stream fails). Returns the number of responses written.
    std::size_t Run();

private:
    const McpDispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcp_echo
