#pragma once
// Types: the data model shared by every stage of the index
//
// RawEntry is one decoded transcript line. ConversationRecord is what the
// cache keeps per session: summaries only, never full message bodies.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace smriti {

// ═══════════════════════════════════════════════════════════════════════════
// Raw transcript entries
// ═══════════════════════════════════════════════════════════════════════════

enum class EntryType {
    User,
    Assistant,
    Summary,
    Other
};

enum class ContentItemType {
    Text,
    ToolUse,
    ToolResult,
    Other
};

enum class TodoStatus {
    Pending,
    InProgress,
    Completed
};

struct TodoItem {
    std::string content;
    TodoStatus status = TodoStatus::Pending;
};

// One element of a message's content list. Only the fields that matter
// for the item's type are filled; everything else stays empty.
struct ContentItem {
    ContentItemType type = ContentItemType::Other;
    std::string text;                   // Text
    std::string name;                   // ToolUse: tool name
    std::optional<std::vector<TodoItem>> todos;  // ToolUse: input.todos, when it is a list
};

struct MessagePayload {
    std::vector<ContentItem> content;   // A plain-string content becomes one Text item
};

struct RawEntry {
    EntryType type = EntryType::Other;
    std::optional<MessagePayload> message;
    std::string timestamp;
    std::string session_id;
    std::string summary;
};

// ═══════════════════════════════════════════════════════════════════════════
// Derived per-session data
// ═══════════════════════════════════════════════════════════════════════════

struct TodoSnapshot {
    size_t message_index = 0;
    std::string timestamp;
    std::vector<TodoItem> todos;
};

struct FinalTodos {
    std::vector<std::string> completed;
    std::vector<std::string> in_progress;
    std::vector<std::string> pending;

    bool empty() const {
        return completed.empty() && in_progress.empty() && pending.empty();
    }

    size_t total() const {
        return completed.size() + in_progress.size() + pending.size();
    }
};

// A phase of work closed by a todo completion. Covers message indices
// (range_start, range_end]; range_end == completed_at.
struct Chapter {
    std::string title;
    size_t range_start = 0;
    size_t range_end = 0;
    size_t completed_at = 0;
    size_t message_count = 0;
};

struct ConversationRecord {
    std::string session_id;
    std::string project;
    std::string file_path;
    std::filesystem::file_time_type mtime{};
    std::string timestamp;              // Last timestamp seen in the file
    std::string title;                  // Last "summary" entry, if any
    size_t message_count = 0;
    size_t user_message_count = 0;
    std::string first_user_message;
    std::vector<std::string> user_message_arc;
    std::vector<TodoSnapshot> todo_snapshots;
    FinalTodos final_todos;
    std::vector<Chapter> chapters;
};

// ═══════════════════════════════════════════════════════════════════════════
// Query and navigation outputs
// ═══════════════════════════════════════════════════════════════════════════

struct SearchResult {
    std::string session_id;
    int score = 0;
    std::vector<std::string> matched_todos;
    std::vector<std::string> matched_user_messages;
    std::string summary;
    std::string project;
    std::string timestamp;
};

enum class Role {
    User,
    Assistant
};

struct Message {
    size_t index = 0;                   // 0-based position among user+assistant entries
    Role role = Role::User;
    std::string content;
    std::string timestamp;
    std::vector<std::string> tools;     // Tool invocation names (assistant only)
    size_t turn = 0;                    // Ordinal of the governing user turn, 0 before the first
};

inline const char* todo_status_to_string(TodoStatus status) {
    switch (status) {
        case TodoStatus::Completed: return "completed";
        case TodoStatus::InProgress: return "in_progress";
        case TodoStatus::Pending: return "pending";
    }
    return "pending";
}

inline const char* role_to_string(Role role) {
    return role == Role::Assistant ? "assistant" : "user";
}

} // namespace smriti
