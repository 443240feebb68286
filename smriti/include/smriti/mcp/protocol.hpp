#pragma once
// MCP Protocol: JSON-RPC 2.0 envelopes and error codes

#include <nlohmann/json.hpp>
#include <string>

namespace smriti::mcp {

using json = nlohmann::json;

// Replace invalid UTF-8 bytes with U+FFFD so json::dump never throws.
// Transcripts are cut at arbitrary byte offsets upstream often enough.
inline std::string sanitize_utf8(const std::string& input) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t width = (c < 0x80) ? 1 :
                       ((c & 0xE0) == 0xC0) ? 2 :
                       ((c & 0xF0) == 0xE0) ? 3 :
                       ((c & 0xF8) == 0xF0) ? 4 : 0;

        bool valid = width > 0 && i + width <= input.size();
        for (size_t k = 1; valid && k < width; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (valid) {
            output.append(input, i, width);
            i += width;
        } else {
            output += replacement;
            ++i;
        }
    }
    return output;
}

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// tools/call result: one text block plus the structured payload
inline json make_tool_response(const std::string& text, bool is_error = false,
                               const json& structured = json()) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", sanitize_utf8(text)}
    });

    json response = {
        {"content", content},
        {"isError", is_error}
    };
    if (!structured.is_null()) {
        response["structuredContent"] = structured;
    }
    return response;
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be an object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
    bool is_notification = false;   // No id: no response is sent
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json()),
        !request.contains("id")
    };
}

} // namespace smriti::mcp
