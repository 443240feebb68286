#pragma once
// EntryParser: JSONL transcript → ordered RawEntry list
//
// One entry per non-empty line, in file order. A line that does not
// decode is skipped; a file that cannot be read yields no entries.
// Unknown shapes degrade to EntryType::Other / ContentItemType::Other.

#include "types.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace smriti {

using json = nlohmann::json;

struct ParseStats {
    size_t lines = 0;       // Non-empty lines seen
    size_t entries = 0;     // Lines decoded into entries
    size_t malformed = 0;   // Lines skipped
};

namespace detail {

// String member or "" when absent or not a string
inline std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace detail

inline EntryType entry_type_from_string(const std::string& tag) {
    if (tag == "user") return EntryType::User;
    if (tag == "assistant") return EntryType::Assistant;
    if (tag == "summary") return EntryType::Summary;
    return EntryType::Other;
}

// Missing or unrecognised status falls back to pending
inline TodoStatus todo_status_from_string(const std::string& status) {
    if (status == "completed") return TodoStatus::Completed;
    if (status == "in_progress") return TodoStatus::InProgress;
    return TodoStatus::Pending;
}

inline std::vector<TodoItem> parse_todos(const json& todos) {
    std::vector<TodoItem> items;
    for (const auto& t : todos) {
        if (!t.is_object()) continue;
        TodoItem item;
        item.content = detail::string_field(t, "content");
        item.status = todo_status_from_string(detail::string_field(t, "status"));
        items.push_back(std::move(item));
    }
    return items;
}

inline ContentItem parse_content_item(const json& item) {
    ContentItem out;
    if (item.is_string()) {
        out.type = ContentItemType::Text;
        out.text = item.get<std::string>();
        return out;
    }
    if (!item.is_object()) return out;

    std::string type = detail::string_field(item, "type");
    if (type == "text") {
        out.type = ContentItemType::Text;
        out.text = detail::string_field(item, "text");
    } else if (type == "tool_use") {
        out.type = ContentItemType::ToolUse;
        out.name = detail::string_field(item, "name");
        auto input = item.find("input");
        if (input != item.end() && input->is_object()) {
            auto todos = input->find("todos");
            if (todos != input->end() && todos->is_array()) {
                out.todos = parse_todos(*todos);
            }
        }
    } else if (type == "tool_result") {
        out.type = ContentItemType::ToolResult;
    }
    return out;
}

inline std::optional<MessagePayload> parse_message(const json& message) {
    if (!message.is_object()) return std::nullopt;

    MessagePayload payload;
    auto content = message.find("content");
    if (content == message.end()) return payload;

    if (content->is_string()) {
        ContentItem text;
        text.type = ContentItemType::Text;
        text.text = content->get<std::string>();
        payload.content.push_back(std::move(text));
    } else if (content->is_array()) {
        for (const auto& item : *content) {
            payload.content.push_back(parse_content_item(item));
        }
    }
    return payload;
}

inline std::optional<RawEntry> parse_entry(const json& data) {
    if (!data.is_object()) return std::nullopt;

    RawEntry entry;
    entry.type = entry_type_from_string(detail::string_field(data, "type"));
    entry.timestamp = detail::string_field(data, "timestamp");
    entry.session_id = detail::string_field(data, "sessionId");
    entry.summary = detail::string_field(data, "summary");
    auto message = data.find("message");
    if (message != data.end()) {
        entry.message = parse_message(*message);
    }
    return entry;
}

inline std::optional<RawEntry> parse_entry_line(const std::string& line) {
    try {
        return parse_entry(json::parse(line));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

inline std::vector<RawEntry> parse_jsonl_file(const std::string& file_path,
                                              ParseStats* stats = nullptr) {
    std::vector<RawEntry> entries;

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        log_debug("EntryParser", "missing transcript: %s", file_path.c_str());
        return entries;
    }

    std::ifstream in(file_path);
    if (!in) {
        log_error("EntryParser", "cannot open %s", file_path.c_str());
        return entries;
    }

    ParseStats local;
    std::string line;
    while (std::getline(in, line)) {
        line = detail::trim(line);
        if (line.empty()) continue;
        ++local.lines;

        auto entry = parse_entry_line(line);
        if (!entry) {
            ++local.malformed;
            continue;
        }
        entries.push_back(std::move(*entry));
        ++local.entries;
    }

    if (in.bad()) {
        log_error("EntryParser", "read error in %s after %zu lines",
                  file_path.c_str(), local.lines);
    }
    if (local.malformed > 0) {
        log_debug("EntryParser", "%s: skipped %zu malformed lines",
                  file_path.c_str(), local.malformed);
    }

    if (stats) *stats = local;
    return entries;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text extraction
// ═══════════════════════════════════════════════════════════════════════════

inline std::string join_text_items(const MessagePayload& message, const char* separator) {
    std::string out;
    bool first = true;
    for (const auto& item : message.content) {
        if (item.type != ContentItemType::Text) continue;
        if (!first) out += separator;
        out += item.text;
        first = false;
    }
    return out;
}

// User messages: text items joined by a space
inline std::string user_text(const RawEntry& entry) {
    if (!entry.message) return "";
    return join_text_items(*entry.message, " ");
}

// Assistant messages: text items joined by a newline
inline std::string assistant_text(const RawEntry& entry) {
    if (!entry.message) return "";
    return join_text_items(*entry.message, "\n");
}

inline std::vector<std::string> tool_names(const RawEntry& entry) {
    std::vector<std::string> names;
    if (!entry.message) return names;
    for (const auto& item : entry.message->content) {
        if (item.type == ContentItemType::ToolUse) names.push_back(item.name);
    }
    return names;
}

inline bool is_message_entry(const RawEntry& entry) {
    return entry.type == EntryType::User || entry.type == EntryType::Assistant;
}

// A user-authored turn, as opposed to a user entry that only carries tool results
inline bool is_user_turn(const RawEntry& entry) {
    return entry.type == EntryType::User && !user_text(entry).empty();
}

} // namespace smriti
