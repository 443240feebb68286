#pragma once
// ConversationExtractor: entries of one session → ConversationRecord
//
// Collects todo snapshots, the final todo partition, message and turn
// counts, and the user-message arc used as a summary when a session has
// no todos. Chapters are derived separately (chapters.hpp).

#include "types.hpp"
#include "entry_parser.hpp"
#include <string>
#include <vector>

namespace smriti {

constexpr size_t ARC_MESSAGE_CHARS = 200;
constexpr const char* TODO_TOOL_MARKER = "TodoWrite";
constexpr size_t SUMMARY_TODO_COUNT = 3;

// Truncate to at most max_chars UTF-8 code points
inline std::string truncate_chars(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (chars == max_chars) return text.substr(0, i);
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t width = (c < 0x80) ? 1 :
                       ((c & 0xE0) == 0xC0) ? 2 :
                       ((c & 0xF0) == 0xE0) ? 3 :
                       ((c & 0xF8) == 0xF0) ? 4 : 1;
        i += width;
        ++chars;
    }
    return text;
}

// First, second, and the last two distinct user messages. Exactly three
// messages are kept whole.
inline std::vector<std::string> build_user_arc(const std::vector<std::string>& user_messages) {
    std::vector<std::string> truncated;
    truncated.reserve(user_messages.size());
    for (const auto& m : user_messages) {
        truncated.push_back(truncate_chars(m, ARC_MESSAGE_CHARS));
    }

    const size_t n = truncated.size();
    if (n <= 3) return truncated;

    std::vector<std::string> arc = {truncated[0], truncated[1]};
    for (size_t i = n - 2; i < n; ++i) {
        bool duplicate = false;
        for (const auto& kept : arc) {
            if (kept == truncated[i]) { duplicate = true; break; }
        }
        if (!duplicate) arc.push_back(truncated[i]);
    }
    return arc;
}

// Partition the last snapshot only; earlier statuses never leak through
inline FinalTodos partition_final_todos(const std::vector<TodoSnapshot>& snapshots) {
    FinalTodos final_todos;
    if (snapshots.empty()) return final_todos;

    for (const auto& todo : snapshots.back().todos) {
        if (todo.content.empty()) continue;
        switch (todo.status) {
            case TodoStatus::Completed:
                final_todos.completed.push_back(todo.content);
                break;
            case TodoStatus::InProgress:
                final_todos.in_progress.push_back(todo.content);
                break;
            case TodoStatus::Pending:
                final_todos.pending.push_back(todo.content);
                break;
        }
    }
    return final_todos;
}

inline const std::vector<TodoItem>* todo_write_input(const ContentItem& item) {
    if (item.type != ContentItemType::ToolUse) return nullptr;
    if (item.name.find(TODO_TOOL_MARKER) == std::string::npos) return nullptr;
    if (!item.todos) return nullptr;
    return &*item.todos;
}

inline ConversationRecord extract_conversation(const std::vector<RawEntry>& entries,
                                               const std::string& file_path = "",
                                               const std::string& project = "") {
    ConversationRecord record;
    record.file_path = file_path;
    record.project = project;

    std::vector<std::string> user_messages;
    size_t message_index = 0;

    for (const auto& entry : entries) {
        if (record.session_id.empty() && !entry.session_id.empty()) {
            record.session_id = entry.session_id;
        }
        if (!entry.timestamp.empty()) {
            record.timestamp = entry.timestamp;
        }
        if (entry.type == EntryType::Summary && !entry.summary.empty()) {
            record.title = entry.summary;
        }

        if (!is_message_entry(entry)) continue;

        // Count before looking at content so indices match raw positions
        ++message_index;

        if (!entry.message) continue;

        if (entry.type == EntryType::User) {
            std::string text = user_text(entry);
            if (!text.empty()) {
                if (user_messages.empty()) {
                    record.first_user_message = truncate_chars(text, ARC_MESSAGE_CHARS);
                }
                user_messages.push_back(std::move(text));
            }
            continue;
        }

        for (const auto& item : entry.message->content) {
            const auto* todos = todo_write_input(item);
            if (!todos) continue;
            TodoSnapshot snapshot;
            snapshot.message_index = message_index;
            snapshot.timestamp = entry.timestamp;
            snapshot.todos = *todos;
            record.todo_snapshots.push_back(std::move(snapshot));
        }
    }

    record.message_count = message_index;
    record.user_message_count = user_messages.size();
    record.user_message_arc = build_user_arc(user_messages);
    record.final_todos = partition_final_todos(record.todo_snapshots);
    return record;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator,
                        size_t max_parts = std::string::npos) {
    std::string out;
    size_t count = 0;
    for (const auto& part : parts) {
        if (count == max_parts) break;
        if (count > 0) out += separator;
        out += part;
        ++count;
    }
    return out;
}

// All todos in completed, in-progress, pending order
inline std::vector<std::string> all_todos(const FinalTodos& todos) {
    std::vector<std::string> out;
    out.reserve(todos.total());
    out.insert(out.end(), todos.completed.begin(), todos.completed.end());
    out.insert(out.end(), todos.in_progress.begin(), todos.in_progress.end());
    out.insert(out.end(), todos.pending.begin(), todos.pending.end());
    return out;
}

inline std::string record_summary(const ConversationRecord& record) {
    const auto& todos = record.final_todos;
    if (!todos.completed.empty()) {
        return join(todos.completed, "; ", SUMMARY_TODO_COUNT);
    }
    if (!todos.empty()) {
        std::vector<std::string> open = todos.in_progress;
        open.insert(open.end(), todos.pending.begin(), todos.pending.end());
        return join(open, "; ", SUMMARY_TODO_COUNT);
    }
    return join(record.user_message_arc, " ... ");
}

} // namespace smriti
