#pragma once
// MCP Session Tools: search, session summaries, message navigation, listings
//
// Every session tool starts with a cache refresh, so results reflect the
// transcripts as they are on disk right now.

#include "../types.hpp"
#include "../protocol.hpp"
#include "../../cache.hpp"
#include "../../config.hpp"
#include "../../extractor.hpp"
#include "../../navigation.hpp"
#include "../../query.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace smriti::mcp::tools::sessions {

using json = nlohmann::json;

// Shared state behind every tool. One per process.
struct ToolContext {
    Config config;
    ConversationCache cache;

    explicit ToolContext(Config cfg)
        : config(std::move(cfg)), cache(config.projects_path) {}
};

// ═══════════════════════════════════════════════════════════════════════════
// Parameter helpers
// ═══════════════════════════════════════════════════════════════════════════

// Empty string when every required key is present
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key) || params[key].is_null()) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return default_val;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return default_val;
    }
}

inline size_t clamp_count(long long value, size_t lo, size_t hi) {
    if (value < static_cast<long long>(lo)) return lo;
    if (value > static_cast<long long>(hi)) return hi;
    return static_cast<size_t>(value);
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON views (external camelCase field names)
// ═══════════════════════════════════════════════════════════════════════════

inline std::string iso_time(fs::file_time_type ftime) {
    using namespace std::chrono;
    auto sys = time_point_cast<system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + system_clock::now());
    std::time_t t = system_clock::to_time_t(sys);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    return buf;
}

inline json strings_json(const std::vector<std::string>& values) {
    json out = json::array();
    for (const auto& v : values) out.push_back(sanitize_utf8(v));
    return out;
}

inline json final_todos_json(const FinalTodos& todos) {
    return {
        {"completed", strings_json(todos.completed)},
        {"inProgress", strings_json(todos.in_progress)},
        {"pending", strings_json(todos.pending)}
    };
}

inline json chapter_json(const Chapter& c) {
    return {
        {"title", sanitize_utf8(c.title)},
        {"messageRange", {c.range_start, c.range_end}},
        {"completedAt", c.completed_at},
        {"messageCount", c.message_count}
    };
}

inline json message_json(const Message& m) {
    json out = {
        {"index", m.index},
        {"role", role_to_string(m.role)},
        {"content", sanitize_utf8(m.content)},
        {"timestamp", m.timestamp},
        {"turn", m.turn}
    };
    if (!m.tools.empty()) out["tools"] = m.tools;
    return out;
}

inline json window_json(const MessageWindow& w) {
    json messages = json::array();
    for (const auto& m : w.messages) messages.push_back(message_json(m));
    return {
        {"messages", messages},
        {"messageCount", w.messages.size()},
        {"totalMessages", w.total_messages},
        {"totalUserTurns", w.total_user_turns},
        {"actualStart", w.actual_start},
        {"actualEnd", w.actual_end},
        {"canExpandBefore", w.can_expand_before},
        {"canExpandAfter", w.can_expand_after}
    };
}

inline void format_messages(std::ostringstream& ss, const MessageWindow& w) {
    for (const auto& m : w.messages) {
        ss << "\n[" << m.index << "] " << role_to_string(m.role);
        if (m.turn > 0) ss << " (turn " << m.turn << ")";
        std::string preview = truncate_chars(m.content, 200);
        ss << ": " << preview;
        if (preview.size() < m.content.size()) ss << "...";
        for (const auto& tool : m.tools) ss << "\n    -> " << tool;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Schemas
// ═══════════════════════════════════════════════════════════════════════════

inline json role_property() {
    return {{"type", "string"}, {"enum", {"user", "assistant"}},
            {"description", "Only return messages with this role"}};
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "search_conversations",
        "Search past sessions by their todo lists (or opening user messages when a session "
        "has no todos). Case-insensitive substring match per keyword; use a few simple "
        "keywords, not full sentences. Returns session ids for follow-up calls.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"description", "Whitespace-separated keywords"}}},
                {"project", {{"type", "string"}, {"description", "Exact project directory name"}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 20}}}
            }},
            {"required", {"query"}}
        }
    });

    tools.push_back({
        "get_session",
        "Summary of one session: chapters of work, final todo lists, message counts and "
        "the opening user messages. Cheap; does not return message bodies.",
        {
            {"type", "object"},
            {"properties", {
                {"session_id", {{"type", "string"}}}
            }},
            {"required", {"session_id"}}
        }
    });

    tools.push_back({
        "get_conversation",
        "Retrieve messages of a session. around_message returns context_size messages on "
        "each side of that index; max_messages or recent_only return the tail; with none "
        "of them the whole conversation is returned (can be large).",
        {
            {"type", "object"},
            {"properties", {
                {"session_id", {{"type", "string"}}},
                {"around_message", {{"type", "integer"}, {"minimum", 0}}},
                {"context_size", {{"type", "integer"}, {"minimum", 0}, {"default", 10}}},
                {"max_messages", {{"type", "integer"}, {"minimum", 1}}},
                {"recent_only", {{"type", "boolean"}, {"default", false},
                                 {"description", "Last 20 messages"}}},
                {"role", role_property()}
            }},
            {"required", {"session_id"}}
        }
    });

    tools.push_back({
        "get_conversation_context",
        "Messages [start, end) of a session, widened by expand on both sides. "
        "canExpandBefore/canExpandAfter tell whether more messages exist.",
        {
            {"type", "object"},
            {"properties", {
                {"session_id", {{"type", "string"}}},
                {"start", {{"type", "integer"}, {"minimum", 0}}},
                {"end", {{"type", "integer"}, {"minimum", 0},
                         {"description", "Exclusive; defaults to start + 1"}}},
                {"expand", {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
                {"role", role_property()}
            }},
            {"required", {"session_id", "start"}}
        }
    });

    tools.push_back({
        "get_turn_context",
        "Messages belonging to user turns [turn - radius, turn + radius]. Turns are "
        "numbered from 1; assistant replies belong to the user turn before them.",
        {
            {"type", "object"},
            {"properties", {
                {"session_id", {{"type", "string"}}},
                {"turn", {{"type", "integer"}, {"minimum", 1}}},
                {"radius", {{"type", "integer"}, {"minimum", 0}, {"default", 1}}},
                {"role", role_property()}
            }},
            {"required", {"session_id", "turn"}}
        }
    });

    tools.push_back({
        "get_chapter",
        "Messages of one chapter (numbered from 0, see get_session), optionally widened "
        "by expand messages on each side.",
        {
            {"type", "object"},
            {"properties", {
                {"session_id", {{"type", "string"}}},
                {"chapter", {{"type", "integer"}, {"minimum", 0}}},
                {"expand", {{"type", "integer"}, {"minimum", 0}, {"default", 0}}},
                {"role", role_property()}
            }},
            {"required", {"session_id", "chapter"}}
        }
    });

    tools.push_back({
        "list_recent",
        "Most recently modified sessions with their summaries and first user message.",
        {
            {"type", "object"},
            {"properties", {
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 10}}}
            }},
            {"required", json::array()}
        }
    });

    tools.push_back({
        "list_projects",
        "Project names usable as the project filter of search_conversations.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool implementations
// ═══════════════════════════════════════════════════════════════════════════

inline ToolResult search_conversations(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"query"});
    if (!missing.empty()) return ToolResult::error(missing);

    std::string query = get_param<std::string>(params, "query", "");
    std::string project = get_param<std::string>(params, "project", "");
    size_t limit = clamp_count(
        get_param<long long>(params, "limit", static_cast<long long>(ctx->config.default_search_limit)),
        1, 100);

    ctx->cache.refresh();
    QueryEngine engine(ctx->cache);
    auto results = engine.search(query, limit, project);

    json results_array = json::array();
    std::ostringstream ss;
    ss << "Found " << results.size() << " sessions for '" << query << "'";
    if (!project.empty()) ss << " in " << project;
    ss << ":\n";

    for (const auto& r : results) {
        results_array.push_back({
            {"sessionId", r.session_id},
            {"score", r.score},
            {"matchedTodos", strings_json(r.matched_todos)},
            {"matchedUserMessages", strings_json(r.matched_user_messages)},
            {"summary", sanitize_utf8(r.summary)},
            {"project", r.project},
            {"timestamp", r.timestamp}
        });
        std::string preview = truncate_chars(r.summary, 120);
        ss << "\n[" << r.score << "] " << r.session_id << " (" << r.project << ") " << preview;
        if (preview.size() < r.summary.size()) ss << "...";
    }

    return ToolResult::ok(ss.str(), {{"results", results_array}});
}

inline ToolResult get_session(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"session_id"});
    if (!missing.empty()) return ToolResult::error(missing);
    std::string session_id = get_param<std::string>(params, "session_id", "");

    ctx->cache.refresh();
    const ConversationRecord* record = ctx->cache.get(session_id);
    if (!record) return ToolResult::error("Conversation " + session_id + " not found");

    json chapters = json::array();
    for (const auto& c : record->chapters) chapters.push_back(chapter_json(c));

    std::string summary = record_summary(*record);
    json data = {
        {"sessionId", record->session_id},
        {"project", record->project},
        {"file", fs::path(record->file_path).filename().string()},
        {"title", sanitize_utf8(record->title)},
        {"summary", sanitize_utf8(summary)},
        {"timestamp", record->timestamp},
        {"messageCount", record->message_count},
        {"userMessageCount", record->user_message_count},
        {"userMessageArc", strings_json(record->user_message_arc)},
        {"todoSnapshotCount", record->todo_snapshots.size()},
        {"finalTodos", final_todos_json(record->final_todos)},
        {"chapters", chapters}
    };

    std::ostringstream ss;
    ss << "Session " << record->session_id << " (" << record->project << ")\n";
    if (!record->title.empty()) ss << record->title << "\n";
    ss << record->message_count << " messages, " << record->user_message_count << " user turns, "
       << record->chapters.size() << " chapters\n";
    for (size_t i = 0; i < record->chapters.size(); ++i) {
        const auto& c = record->chapters[i];
        ss << "\n  " << i << ". " << c.title << " (" << c.range_start << ", " << c.range_end << "]";
    }
    if (!record->final_todos.in_progress.empty()) {
        ss << "\nIn progress: " << join(record->final_todos.in_progress, "; ");
    }
    if (!record->final_todos.pending.empty()) {
        ss << "\nPending: " << join(record->final_todos.pending, "; ");
    }
    if (record->final_todos.empty()) {
        ss << "\n" << summary;
    }

    return ToolResult::ok(ss.str(), data);
}

inline ToolResult get_conversation(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"session_id"});
    if (!missing.empty()) return ToolResult::error(missing);
    std::string session_id = get_param<std::string>(params, "session_id", "");

    std::optional<Role> role;
    if (!parse_role_filter(get_param<std::string>(params, "role", ""), role)) {
        return ToolResult::error("role must be 'user' or 'assistant'");
    }

    ctx->cache.refresh();
    NavigationService nav(ctx->cache);
    Transcript transcript;
    std::string error_msg;
    if (!nav.load(session_id, transcript, error_msg)) return ToolResult::error(error_msg);

    MessageWindow window;
    if (params.contains("around_message") && !params["around_message"].is_null()) {
        long long around = get_param<long long>(params, "around_message", 0);
        size_t context_size = clamp_count(
            get_param<long long>(params, "context_size",
                                 static_cast<long long>(ctx->config.default_context_size)),
            0, 1000);
        window = select_range(transcript, around, saturating_add(around, 1), context_size, role);
    } else if (get_param<bool>(params, "recent_only", false)) {
        window = select_tail(transcript, ctx->config.recent_only_count, role);
    } else if (params.contains("max_messages") && !params["max_messages"].is_null()) {
        size_t max_messages = clamp_count(get_param<long long>(params, "max_messages", 1), 1, 100000);
        window = select_tail(transcript, max_messages, role);
    } else {
        window = select_range(transcript, 0, static_cast<long long>(transcript.messages.size()), 0, role);
    }

    json data = window_json(window);
    data["sessionId"] = session_id;
    if (const ConversationRecord* record = ctx->cache.get(session_id)) {
        data["project"] = record->project;
        data["file"] = fs::path(record->file_path).filename().string();
    }
    data["summary"] = sanitize_utf8(transcript.title);
    data["truncated"] = window.messages.size() < window.total_messages;

    std::ostringstream ss;
    ss << "Conversation " << session_id << ": messages [" << window.actual_start << ", "
       << window.actual_end << ") of " << window.total_messages;
    format_messages(ss, window);
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult get_conversation_context(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"session_id", "start"});
    if (!missing.empty()) return ToolResult::error(missing);
    std::string session_id = get_param<std::string>(params, "session_id", "");
    long long start = get_param<long long>(params, "start", 0);
    long long end = get_param<long long>(params, "end", saturating_add(start, 1));
    size_t expand = clamp_count(get_param<long long>(params, "expand", 0), 0, 100000);

    std::optional<Role> role;
    if (!parse_role_filter(get_param<std::string>(params, "role", ""), role)) {
        return ToolResult::error("role must be 'user' or 'assistant'");
    }

    ctx->cache.refresh();
    NavigationService nav(ctx->cache);
    MessageWindow window;
    std::string error_msg;
    if (!nav.context(session_id, start, end, expand, role, window, error_msg)) {
        return ToolResult::error(error_msg);
    }

    json data = window_json(window);
    data["sessionId"] = session_id;

    std::ostringstream ss;
    ss << "Messages [" << window.actual_start << ", " << window.actual_end << ") of "
       << window.total_messages;
    if (window.can_expand_before) ss << " (more before)";
    if (window.can_expand_after) ss << " (more after)";
    format_messages(ss, window);
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult get_turn_context(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"session_id", "turn"});
    if (!missing.empty()) return ToolResult::error(missing);
    std::string session_id = get_param<std::string>(params, "session_id", "");
    long long turn = get_param<long long>(params, "turn", 1);
    size_t radius = clamp_count(get_param<long long>(params, "radius", 1), 0, 100000);

    std::optional<Role> role;
    if (!parse_role_filter(get_param<std::string>(params, "role", ""), role)) {
        return ToolResult::error("role must be 'user' or 'assistant'");
    }

    ctx->cache.refresh();
    NavigationService nav(ctx->cache);
    MessageWindow window;
    std::string error_msg;
    if (!nav.turn_context(session_id, turn, radius, role, window, error_msg)) {
        return ToolResult::error(error_msg);
    }

    json data = window_json(window);
    data["sessionId"] = session_id;
    data["firstTurn"] = window.first_turn;
    data["lastTurn"] = window.last_turn;

    std::ostringstream ss;
    if (window.first_turn == 0) {
        ss << "No user turns in range (" << window.total_user_turns << " turns total)";
    } else {
        ss << "Turns " << window.first_turn << "-" << window.last_turn << " of "
           << window.total_user_turns;
    }
    format_messages(ss, window);
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult get_chapter(ToolContext* ctx, const json& params) {
    std::string missing = validate_required(params, {"session_id", "chapter"});
    if (!missing.empty()) return ToolResult::error(missing);
    std::string session_id = get_param<std::string>(params, "session_id", "");
    long long chapter_index = get_param<long long>(params, "chapter", -1);
    if (chapter_index < 0) return ToolResult::error("chapter must be a non-negative integer");
    size_t expand = clamp_count(get_param<long long>(params, "expand", 0), 0, 100000);

    std::optional<Role> role;
    if (!parse_role_filter(get_param<std::string>(params, "role", ""), role)) {
        return ToolResult::error("role must be 'user' or 'assistant'");
    }

    ctx->cache.refresh();
    NavigationService nav(ctx->cache);
    MessageWindow window;
    Chapter chapter;
    std::string error_msg;
    if (!nav.chapter(session_id, static_cast<size_t>(chapter_index), expand, role,
                     window, chapter, error_msg)) {
        return ToolResult::error(error_msg);
    }

    json data = window_json(window);
    data["sessionId"] = session_id;
    data["chapter"] = chapter_json(chapter);

    std::ostringstream ss;
    ss << "Chapter " << chapter_index << ": " << chapter.title << " ("
       << chapter.range_start << ", " << chapter.range_end << "]";
    format_messages(ss, window);
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult list_recent(ToolContext* ctx, const json& params) {
    size_t limit = clamp_count(
        get_param<long long>(params, "limit", static_cast<long long>(ctx->config.default_recent_limit)),
        1, 100);

    ctx->cache.refresh();
    auto records = ctx->cache.records();
    std::sort(records.begin(), records.end(),
              [](const ConversationRecord* a, const ConversationRecord* b) {
                  if (a->mtime != b->mtime) return a->mtime > b->mtime;
                  return a->session_id < b->session_id;
              });
    if (records.size() > limit) records.resize(limit);

    json conversations = json::array();
    std::ostringstream ss;
    ss << records.size() << " recent sessions:\n";
    for (const auto* r : records) {
        std::string summary = record_summary(*r);
        std::string modified = iso_time(r->mtime);
        conversations.push_back({
            {"sessionId", r->session_id},
            {"project", r->project},
            {"file", fs::path(r->file_path).filename().string()},
            {"title", sanitize_utf8(r->title)},
            {"summary", sanitize_utf8(summary)},
            {"firstMessage", sanitize_utf8(r->first_user_message)},
            {"lastModified", modified}
        });
        ss << "\n" << modified << " " << r->session_id << " (" << r->project << ") "
           << (r->title.empty() ? truncate_chars(summary, 100) : r->title);
    }

    return ToolResult::ok(ss.str(), {{"conversations", conversations}});
}

inline ToolResult list_projects(ToolContext* ctx, const json& /*params*/) {
    auto projects = list_project_names(ctx->cache.projects_root());

    std::ostringstream ss;
    ss << projects.size() << " projects:";
    for (const auto& p : projects) ss << "\n  " << p;

    return ToolResult::ok(ss.str(), {{"projects", projects}});
}

inline void register_handlers(ToolContext* ctx,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["search_conversations"] = [ctx](const json& p) { return search_conversations(ctx, p); };
    handlers["get_session"] = [ctx](const json& p) { return get_session(ctx, p); };
    handlers["get_conversation"] = [ctx](const json& p) { return get_conversation(ctx, p); };
    handlers["get_conversation_context"] = [ctx](const json& p) { return get_conversation_context(ctx, p); };
    handlers["get_turn_context"] = [ctx](const json& p) { return get_turn_context(ctx, p); };
    handlers["get_chapter"] = [ctx](const json& p) { return get_chapter(ctx, p); };
    handlers["list_recent"] = [ctx](const json& p) { return list_recent(ctx, p); };
    handlers["list_projects"] = [ctx](const json& p) { return list_projects(ctx, p); };
}

} // namespace smriti::mcp::tools::sessions
