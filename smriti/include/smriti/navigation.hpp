#pragma once
// NavigationService: message windows over one transcript
//
// The cache holds summaries only, so every call re-parses the backing
// file to get full message bodies. Message positions follow the same
// count the extractor uses: one per user or assistant entry, empty or not.
//
// Addressing:
//   absolute  [start, end) widened by expand on both sides
//   turn      user turns [t - r, t + r] clamped to [1, total turns]
//   chapter   a chapter's (start, end] as an absolute window
//   tail      the last N messages
// A role filter, when given, is applied after the range is chosen.

#include "types.hpp"
#include "entry_parser.hpp"
#include "cache.hpp"
#include <algorithm>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace smriti {

struct Transcript {
    std::string title;
    std::vector<Message> messages;
    size_t total_user_turns = 0;
};

struct MessageWindow {
    std::vector<Message> messages;
    size_t total_messages = 0;
    size_t total_user_turns = 0;
    size_t actual_start = 0;            // Slice [actual_start, actual_end) before role filtering
    size_t actual_end = 0;
    size_t first_turn = 0;              // Turn mode only
    size_t last_turn = 0;
    bool can_expand_before = false;
    bool can_expand_after = false;
};

// "" means no filter. Returns false for anything else that is not a role.
inline bool parse_role_filter(const std::string& value, std::optional<Role>& out) {
    if (value.empty()) {
        out.reset();
        return true;
    }
    if (value == "user") {
        out = Role::User;
        return true;
    }
    if (value == "assistant") {
        out = Role::Assistant;
        return true;
    }
    return false;
}

inline Transcript build_transcript(const std::vector<RawEntry>& entries) {
    Transcript transcript;
    size_t turn = 0;

    for (const auto& entry : entries) {
        if (entry.type == EntryType::Summary && !entry.summary.empty()) {
            transcript.title = entry.summary;
        }
        if (!is_message_entry(entry)) continue;

        Message message;
        message.index = transcript.messages.size();
        message.timestamp = entry.timestamp;
        if (entry.type == EntryType::User) {
            message.role = Role::User;
            message.content = user_text(entry);
            if (!message.content.empty()) ++turn;
        } else {
            message.role = Role::Assistant;
            message.content = assistant_text(entry);
            message.tools = tool_names(entry);
        }
        message.turn = turn;
        transcript.messages.push_back(std::move(message));
    }

    transcript.total_user_turns = turn;
    return transcript;
}

// a + b for b >= 0, pinned at LLONG_MAX. Callers pass raw JSON integers.
inline long long saturating_add(long long a, long long b) {
    if (a > std::numeric_limits<long long>::max() - b) return std::numeric_limits<long long>::max();
    return a + b;
}

namespace detail {

inline long long to_signed(size_t n) {
    constexpr size_t max = static_cast<size_t>(std::numeric_limits<long long>::max());
    return static_cast<long long>(std::min(n, max));
}

inline void fill_messages(MessageWindow& window, const Transcript& transcript,
                          size_t begin, size_t end, const std::optional<Role>& role) {
    for (size_t i = begin; i < end; ++i) {
        const auto& m = transcript.messages[i];
        if (role && m.role != *role) continue;
        window.messages.push_back(m);
    }
}

inline MessageWindow empty_window(const Transcript& transcript) {
    MessageWindow window;
    window.total_messages = transcript.messages.size();
    window.total_user_turns = transcript.total_user_turns;
    return window;
}

} // namespace detail

inline MessageWindow select_range(const Transcript& transcript, long long start, long long end,
                                  size_t expand, const std::optional<Role>& role = std::nullopt) {
    MessageWindow window = detail::empty_window(transcript);
    const long long total = detail::to_signed(window.total_messages);
    const long long e = detail::to_signed(expand);

    if (start < 0) start = 0;
    if (end < start) end = start;

    long long actual_start = std::min(std::max(0LL, start - e), total);
    long long actual_end = std::max(std::min(total, saturating_add(end, e)), actual_start);

    window.actual_start = static_cast<size_t>(actual_start);
    window.actual_end = static_cast<size_t>(actual_end);
    window.can_expand_before = actual_start > 0;
    window.can_expand_after = actual_end < total;
    detail::fill_messages(window, transcript, window.actual_start, window.actual_end, role);
    return window;
}

inline MessageWindow select_turns(const Transcript& transcript, long long turn, size_t radius,
                                  const std::optional<Role>& role = std::nullopt) {
    MessageWindow window = detail::empty_window(transcript);
    const long long total_turns = static_cast<long long>(transcript.total_user_turns);
    if (total_turns == 0) return window;

    const long long r = detail::to_signed(radius);
    long long lo = turn <= r ? 1 : std::max(1LL, turn - r);
    long long hi = std::min(total_turns, saturating_add(turn, r));
    if (lo > hi) return window;

    window.first_turn = static_cast<size_t>(lo);
    window.last_turn = static_cast<size_t>(hi);
    window.can_expand_before = lo > 1;
    window.can_expand_after = hi < total_turns;

    bool any = false;
    for (const auto& m : transcript.messages) {
        long long tag = static_cast<long long>(m.turn);
        if (tag < lo || tag > hi) continue;
        if (!any) {
            window.actual_start = m.index;
            any = true;
        }
        window.actual_end = m.index + 1;
        if (role && m.role != *role) continue;
        window.messages.push_back(m);
    }
    return window;
}

inline MessageWindow select_tail(const Transcript& transcript, size_t count,
                                 const std::optional<Role>& role = std::nullopt) {
    MessageWindow window = detail::empty_window(transcript);
    size_t total = window.total_messages;
    window.actual_start = total > count ? total - count : 0;
    window.actual_end = total;
    window.can_expand_before = window.actual_start > 0;
    detail::fill_messages(window, transcript, window.actual_start, window.actual_end, role);
    return window;
}

class NavigationService {
public:
    explicit NavigationService(const ConversationCache& cache) : cache_(cache) {}

    // Re-parse the session's backing file
    bool load(const std::string& session_id, Transcript& out, std::string& error_msg) const {
        const ConversationRecord* record = cache_.get(session_id);
        if (!record) {
            error_msg = "Conversation " + session_id + " not found";
            return false;
        }

        std::error_code ec;
        if (!std::filesystem::exists(record->file_path, ec)) {
            error_msg = "Conversation " + session_id + " backing file missing: " + record->file_path;
            return false;
        }

        out = build_transcript(parse_jsonl_file(record->file_path));
        return true;
    }

    bool context(const std::string& session_id, long long start, long long end, size_t expand,
                 const std::optional<Role>& role, MessageWindow& out,
                 std::string& error_msg) const {
        Transcript transcript;
        if (!load(session_id, transcript, error_msg)) return false;
        out = select_range(transcript, start, end, expand, role);
        return true;
    }

    bool turn_context(const std::string& session_id, long long turn, size_t radius,
                      const std::optional<Role>& role, MessageWindow& out,
                      std::string& error_msg) const {
        Transcript transcript;
        if (!load(session_id, transcript, error_msg)) return false;
        out = select_turns(transcript, turn, radius, role);
        return true;
    }

    // Chapter (a, b] is the absolute slice [a, b)
    bool chapter(const std::string& session_id, size_t chapter_index, size_t expand,
                 const std::optional<Role>& role, MessageWindow& out, Chapter& chapter_out,
                 std::string& error_msg) const {
        const ConversationRecord* record = cache_.get(session_id);
        if (!record) {
            error_msg = "Conversation " + session_id + " not found";
            return false;
        }
        if (chapter_index >= record->chapters.size()) {
            error_msg = "Chapter " + std::to_string(chapter_index) + " out of range (" +
                        std::to_string(record->chapters.size()) + " chapters)";
            return false;
        }
        chapter_out = record->chapters[chapter_index];
        return context(session_id,
                       static_cast<long long>(chapter_out.range_start),
                       static_cast<long long>(chapter_out.range_end),
                       expand, role, out, error_msg);
    }

private:
    const ConversationCache& cache_;
};

} // namespace smriti
