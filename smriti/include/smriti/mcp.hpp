#pragma once
// MCP Server: Model Context Protocol over stdio
//
// One JSON-RPC request per line on stdin, one response per line on stdout.
// Requests are served one at a time; the cache is never touched concurrently.

#include "mcp/handler.hpp"
#include "log.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

namespace smriti {

class MCPServer {
public:
    explicit MCPServer(std::shared_ptr<mcp::tools::sessions::ToolContext> context)
        : handler_(std::move(context))
        , running_(false)
    {}

    void run(std::istream& in = std::cin, std::ostream& out = std::cout) {
        running_ = true;
        std::string line;
        size_t served = 0;

        while (running_ && std::getline(in, line)) {
            if (line.empty()) continue;

            std::string response = handler_.handle(line);
            ++served;
            if (response.empty()) continue;
            out << response << "\n";
            out.flush();
        }

        log_debug("smriti", "stdin closed after %zu requests", served);
    }

    void stop() { running_ = false; }

    mcp::Handler& handler() { return handler_; }

private:
    mcp::Handler handler_;
    std::atomic<bool> running_;
};

} // namespace smriti
