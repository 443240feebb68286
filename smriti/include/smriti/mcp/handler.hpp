#pragma once
// MCP Handler: JSON-RPC dispatch for the session tools
//
// Used by the stdio server loop and by the one-shot CLI mode alike.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/sessions.hpp"
#include "../log.hpp"
#include "../version.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace smriti::mcp {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(std::shared_ptr<tools::sessions::ToolContext> context)
        : context_(std::move(context)) {
        register_all_tools();
    }

    // Process one JSON-RPC request line. Empty string for notifications.
    std::string handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request);
            if (response.is_null()) return "";
            return response.dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const json::parse_error& e) {
            // what() quotes the offending bytes, which may not be valid UTF-8
            return make_error(json(), error::PARSE_ERROR,
                              sanitize_utf8(std::string("JSON parse error: ") + e.what()))
                .dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              sanitize_utf8(std::string("Internal error: ") + e.what()))
                .dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }

    // Run a tool directly, bypassing the JSON-RPC envelope
    ToolResult call_tool(const std::string& name, const json& arguments) {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return ToolResult::error("Unknown tool: " + name);
        }
        return it->second(arguments);
    }

    bool has_tool(const std::string& name) const {
        return handlers_.count(name) > 0;
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }

private:
    std::shared_ptr<tools::sessions::ToolContext> context_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;

    void register_all_tools() {
        tools::sessions::register_schemas(tools_);
        tools::sessions::register_handlers(context_.get(), handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.is_notification) {
            log_debug("mcp", "notification: %s", info.method.c_str());
            return json();
        }

        if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.params, info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else {
            return make_error(info.id, error::METHOD_NOT_FOUND,
                              "Unknown method: " + info.method);
        }
    }

    json handle_initialize(const json& /*params*/, const json& id) {
        return make_result(id, {
            {"protocolVersion", SMRITI_MCP_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", "smriti"},
                {"version", SMRITI_VERSION}
            }},
            {"capabilities", {{"tools", json::object()}}}
        });
    }

    json handle_tools_list(const json& /*params*/, const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            log_debug("mcp", "%s -> %s", name.c_str(), result.is_error ? "error" : "ok");
            return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
        } catch (const std::exception& e) {
            log_error("mcp", "%s failed: %s", name.c_str(), e.what());
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              sanitize_utf8(std::string("Tool execution failed: ") + e.what()));
        }
    }
};

} // namespace smriti::mcp
