#pragma once
// MCP Types: tool schema and result types
//
// Every tool answers with a structured payload carrying a success flag.
// Failures never throw out of a tool: they come back as
// {success: false, error: <message>} with isError set.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace smriti::mcp {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text
    json structured;          // {success, ...} or {success: false, error}

    static ToolResult ok(const std::string& text, json data = json::object()) {
        data["success"] = true;
        return {false, text, std::move(data)};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, {{"success", false}, {"error", message}}};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

} // namespace smriti::mcp
