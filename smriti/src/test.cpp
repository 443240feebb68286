#include <smriti/smriti.hpp>
#include <smriti/mcp.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace smriti;
using json = nlohmann::json;
namespace fs = std::filesystem;

using Strings = std::vector<std::string>;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

fs::path make_temp_root() {
    static std::mt19937_64 rng{std::random_device{}()};
    fs::path dir = fs::temp_directory_path() / ("smriti-test-" + std::to_string(rng()));
    fs::create_directories(dir);
    return dir;
}

json user_line(const std::string& text, const std::string& ts = "2025-01-01T00:00:00Z",
               const std::string& sid = "") {
    json j = {{"type", "user"}, {"message", {{"role", "user"}, {"content", text}}}, {"timestamp", ts}};
    if (!sid.empty()) j["sessionId"] = sid;
    return j;
}

json tool_result_line() {
    return {{"type", "user"},
            {"message", {{"role", "user"}, {"content", json::array({
                {{"type", "tool_result"}, {"tool_use_id", "t1"}, {"content", "ok"}}})}}}};
}

json assistant_line(const std::string& text, const std::string& ts = "2025-01-01T00:00:01Z") {
    return {{"type", "assistant"},
            {"message", {{"role", "assistant"}, {"content", json::array({
                {{"type", "text"}, {"text", text}}})}}},
            {"timestamp", ts}};
}

json todo_line(const std::vector<std::pair<std::string, std::string>>& todos,
               const std::string& ts = "2025-01-01T00:00:02Z",
               const std::string& tool = "TodoWrite") {
    json items = json::array();
    for (const auto& [content, status] : todos) {
        json t = {{"content", content}};
        if (!status.empty()) t["status"] = status;
        items.push_back(t);
    }
    return {{"type", "assistant"},
            {"message", {{"role", "assistant"}, {"content", json::array({
                {{"type", "tool_use"}, {"id", "t1"}, {"name", tool}, {"input", {{"todos", items}}}}})}}},
            {"timestamp", ts}};
}

void write_lines(const fs::path& path, const std::vector<std::string>& lines) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    for (const auto& line : lines) out << line << "\n";
}

void write_transcript(const fs::path& path, const std::vector<json>& entries) {
    std::vector<std::string> lines;
    for (const auto& e : entries) lines.push_back(e.dump());
    write_lines(path, lines);
}

std::vector<RawEntry> entries_of(const std::vector<json>& lines) {
    std::vector<RawEntry> entries;
    for (const auto& l : lines) {
        auto e = parse_entry(l);
        assert(e.has_value());
        entries.push_back(*e);
    }
    return entries;
}

// Twenty alternating user/assistant messages, ten user turns
std::vector<json> twenty_messages() {
    std::vector<json> lines;
    for (int i = 0; i < 10; ++i) {
        lines.push_back(user_line("question " + std::to_string(i + 1)));
        lines.push_back(assistant_line("answer " + std::to_string(i + 1)));
    }
    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════
// EntryParser
// ═══════════════════════════════════════════════════════════════════════════

void test_entry_parser_skips_malformed_lines() {
    std::cout << "Testing EntryParser malformed lines..." << std::endl;

    fs::path root = make_temp_root();
    fs::path file = root / "proj" / "s1.jsonl";
    write_lines(file, {
        user_line("hello", "t0", "s1").dump(),
        "{not json",
        "",
        "   ",
        "[1, 2, 3]",
        assistant_line("hi").dump(),
        R"({"type":"summary","summary":"Greeting session"})"
    });

    ParseStats stats;
    auto entries = parse_jsonl_file(file.string(), &stats);
    assert(entries.size() == 3);
    assert(stats.lines == 5);
    assert(stats.malformed == 2);
    assert(entries[0].type == EntryType::User);
    assert(entries[0].session_id == "s1");
    assert(entries[1].type == EntryType::Assistant);
    assert(entries[2].type == EntryType::Summary);
    assert(entries[2].summary == "Greeting session");

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_entry_parser_missing_file() {
    std::cout << "Testing EntryParser missing file..." << std::endl;

    auto entries = parse_jsonl_file("/nonexistent/smriti/none.jsonl");
    assert(entries.empty());

    std::cout << "  PASS" << std::endl;
}

void test_entry_parser_content_shapes() {
    std::cout << "Testing EntryParser content shapes..." << std::endl;

    auto text = parse_entry_line(R"({"type":"user","message":{"content":"plain"}})");
    assert(text && text->message);
    assert(user_text(*text) == "plain");

    auto list = parse_entry_line(
        R"({"type":"user","message":{"content":["a",{"type":"text","text":"b"},{"type":"image"}]}})");
    assert(list && list->message);
    assert(list->message->content.size() == 3);
    assert(user_text(*list) == "a b");

    auto todos = parse_entry(todo_line({{"write parser", "completed"}, {"no status", ""}}));
    assert(todos && todos->message);
    const auto& item = todos->message->content[0];
    assert(item.type == ContentItemType::ToolUse);
    assert(item.name == "TodoWrite");
    assert(item.todos.has_value());
    assert((*item.todos)[0].status == TodoStatus::Completed);
    assert((*item.todos)[1].status == TodoStatus::Pending);

    // Wrong field types degrade instead of failing the line
    auto odd = parse_entry_line(R"({"type":7,"message":{"content":42},"timestamp":null})");
    assert(odd.has_value());
    assert(odd->type == EntryType::Other);
    assert(odd->timestamp.empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ConversationExtractor
// ═══════════════════════════════════════════════════════════════════════════

void test_extractor_indices_follow_raw_positions() {
    std::cout << "Testing Extractor message indices..." << std::endl;

    json no_payload = {{"type", "assistant"}, {"timestamp", "2025-01-01T00:00:03Z"}};
    auto entries = entries_of({
        {{"type", "summary"}, {"summary", "Title"}},
        user_line("start", "2025-01-01T00:00:00Z", "abc"),
        tool_result_line(),
        no_payload,
        todo_line({{"step one", "in_progress"}}, "2025-01-01T00:00:04Z"),
        user_line("more", "2025-01-01T00:00:05Z", "other"),
        todo_line({{"step one", "completed"}}, "2025-01-01T00:00:06Z")
    });

    auto record = extract_conversation(entries, "/x/abc.jsonl", "proj");
    assert(record.session_id == "abc");
    assert(record.title == "Title");
    assert(record.timestamp == "2025-01-01T00:00:06Z");
    assert(record.message_count == 6);
    assert(record.user_message_count == 2);
    assert(record.first_user_message == "start");
    assert(record.todo_snapshots.size() == 2);
    assert(record.todo_snapshots[0].message_index == 4);
    assert(record.todo_snapshots[0].timestamp == "2025-01-01T00:00:04Z");
    assert(record.todo_snapshots[1].message_index == 6);

    std::cout << "  PASS" << std::endl;
}

void test_extractor_marker_is_substring() {
    std::cout << "Testing Extractor TodoWrite marker..." << std::endl;

    auto entries = entries_of({
        todo_line({{"a", "completed"}}, "t1", "mcp__tasks__TodoWrite"),
        todo_line({{"b", "completed"}}, "t2", "TodoRead"),
        todo_line({{"c", "pending"}}, "t3", "TodoWriter")
    });
    auto record = extract_conversation(entries);
    assert(record.todo_snapshots.size() == 2);
    assert(record.todo_snapshots[0].message_index == 1);
    assert(record.todo_snapshots[1].message_index == 3);

    std::cout << "  PASS" << std::endl;
}

void test_extractor_final_todos_last_snapshot_only() {
    std::cout << "Testing Extractor final todos..." << std::endl;

    auto entries = entries_of({
        todo_line({{"parse", "completed"}, {"index", "in_progress"}, {"ship", "pending"}}),
        todo_line({{"parse", "pending"}, {"index", "completed"}, {"", "completed"},
                   {"ship", "in_progress"}, {"docs", ""}})
    });
    auto record = extract_conversation(entries);
    const auto& f = record.final_todos;
    assert(f.completed == (Strings{"index"}));
    assert(f.in_progress == (Strings{"ship"}));
    assert(f.pending == (Strings{"parse", "docs"}));
    assert(record_summary(record) == "index");

    std::cout << "  PASS" << std::endl;
}

void test_user_arc() {
    std::cout << "Testing user message arc..." << std::endl;

    assert(build_user_arc({}).empty());
    assert(build_user_arc({"a"}) == (Strings{"a"}));
    assert(build_user_arc({"a", "b"}) == (Strings{"a", "b"}));
    assert(build_user_arc({"a", "b", "c"}) == (Strings{"a", "b", "c"}));
    assert(build_user_arc({"a", "b", "c", "d"}) == (Strings{"a", "b", "c", "d"}));
    assert(build_user_arc({"a", "b", "c", "d", "e", "f"}) ==
           (Strings{"a", "b", "e", "f"}));
    // Tail repeats of kept messages are not added twice
    assert(build_user_arc({"a", "b", "x", "b", "b"}) == (Strings{"a", "b"}));

    std::string long_message(250, 'x');
    auto arc = build_user_arc({long_message});
    assert(arc[0].size() == 200);

    // Truncation counts code points, not bytes
    std::string accented;
    for (int i = 0; i < 210; ++i) accented += "\xC3\xA9";
    assert(truncate_chars(accented, 200).size() == 400);

    std::cout << "  PASS" << std::endl;
}

void test_no_snapshots_summary_from_arc() {
    std::cout << "Testing session without todos..." << std::endl;

    auto entries = entries_of({
        user_line("fix the login page"),
        assistant_line("done"),
        user_line("now the footer")
    });
    auto record = extract_conversation(entries);
    record.chapters = segment_chapters(record.todo_snapshots);
    assert(record.todo_snapshots.empty());
    assert(record.chapters.empty());
    assert(record.final_todos.empty());
    assert(record_summary(record) == "fix the login page ... now the footer");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ChapterSegmenter
// ═══════════════════════════════════════════════════════════════════════════

TodoSnapshot snapshot_at(size_t index, const std::vector<std::pair<std::string, TodoStatus>>& todos) {
    TodoSnapshot s;
    s.message_index = index;
    for (const auto& [content, status] : todos) s.todos.push_back({content, status});
    return s;
}

void test_chapters_chain_in_completion_order() {
    std::cout << "Testing chapters chained..." << std::endl;

    auto chapters = segment_chapters({
        snapshot_at(3, {{"design", TodoStatus::InProgress}, {"build", TodoStatus::Pending}}),
        snapshot_at(4, {{"design", TodoStatus::Completed}, {"build", TodoStatus::InProgress}}),
        snapshot_at(9, {{"design", TodoStatus::Completed}, {"build", TodoStatus::Completed},
                        {"test", TodoStatus::Pending}}),
        snapshot_at(15, {{"design", TodoStatus::Completed}, {"build", TodoStatus::Completed},
                         {"test", TodoStatus::Completed}})
    });

    assert(chapters.size() == 3);
    assert(chapters[0].title == "design");
    assert(chapters[0].range_start == 0 && chapters[0].range_end == 4);
    assert(chapters[0].message_count == 4);
    assert(chapters[1].title == "build");
    assert(chapters[1].range_start == 4 && chapters[1].range_end == 9);
    assert(chapters[2].title == "test");
    assert(chapters[2].range_start == 9 && chapters[2].range_end == 15);
    assert(chapters[2].message_count == 6);

    for (size_t i = 0; i < chapters.size(); ++i) {
        assert(chapters[i].completed_at == chapters[i].range_end);
        if (i > 0) {
            assert(chapters[i].range_start == chapters[i - 1].completed_at);
            assert(chapters[i].completed_at >= chapters[i - 1].completed_at);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_chapters_same_snapshot_zero_width() {
    std::cout << "Testing chapters closed in one snapshot..." << std::endl;

    auto chapters = segment_chapters({
        snapshot_at(4, {{"setup", TodoStatus::Completed}}),
        snapshot_at(10, {{"setup", TodoStatus::Completed}, {"alpha", TodoStatus::Completed},
                         {"beta", TodoStatus::Completed}})
    });

    assert(chapters.size() == 3);
    assert(chapters[1].title == "alpha");
    assert(chapters[1].range_start == 4 && chapters[1].range_end == 10);
    assert(chapters[2].title == "beta");
    assert(chapters[2].range_start == 10 && chapters[2].range_end == 10);
    assert(chapters[2].message_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_chapters_dedupe_reopened_todo() {
    std::cout << "Testing chapters dedupe..." << std::endl;

    // A todo completed, reopened and completed again yields one chapter
    auto chapters = segment_chapters({
        snapshot_at(2, {{"wire api", TodoStatus::Completed}}),
        snapshot_at(5, {{"wire api", TodoStatus::InProgress}}),
        snapshot_at(8, {{"wire api", TodoStatus::Completed}})
    });
    assert(chapters.size() == 1);
    assert(chapters[0].completed_at == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// ConversationCache
// ═══════════════════════════════════════════════════════════════════════════

void test_cache_refresh_skips_unchanged_files() {
    std::cout << "Testing cache refresh counter..." << std::endl;

    fs::path root = make_temp_root();
    fs::path a = root / "proj-a" / "aaa.jsonl";
    fs::path b = root / "proj-b" / "bbb.jsonl";
    write_transcript(a, {user_line("first", "t1", "aaa"), todo_line({{"one", "completed"}})});
    write_transcript(b, {user_line("second", "t2", "bbb")});
    write_lines(root / "proj-b" / "notes.txt", {"ignored"});

    auto base = fs::file_time_type::clock::now() - std::chrono::hours(1);
    fs::last_write_time(a, base);
    fs::last_write_time(b, base);

    ConversationCache cache(root);
    auto first = cache.refresh();
    assert(first.scanned == 2);
    assert(first.parsed == 2);
    assert(cache.parse_count() == 2);
    assert(cache.size() == 2);

    auto second = cache.refresh();
    assert(second.parsed == 0);
    assert(cache.parse_count() == 2);

    // Older mtime still counts as fresh
    fs::last_write_time(a, base - std::chrono::minutes(5));
    cache.refresh();
    assert(cache.parse_count() == 2);

    // Newer content replaces the record wholesale
    write_transcript(a, {user_line("rewritten", "t3", "aaa")});
    fs::last_write_time(a, base + std::chrono::minutes(5));
    cache.refresh();
    assert(cache.parse_count() == 3);
    const ConversationRecord* rec = cache.get("aaa");
    assert(rec != nullptr);
    assert(rec->project == "proj-a");
    assert(rec->chapters.empty());
    assert(rec->todo_snapshots.empty());
    assert(rec->user_message_arc == (Strings{"rewritten"}));

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_cache_lookup_and_deleted_files() {
    std::cout << "Testing cache lookup..." << std::endl;

    fs::path root = make_temp_root();
    fs::path file = root / "proj" / "file-stem.jsonl";
    write_transcript(file, {user_line("hello", "t1", "inner-id")});

    ConversationCache cache(root);
    cache.refresh();
    assert(cache.get("file-stem") != nullptr);
    assert(cache.get("inner-id") != nullptr);
    assert(cache.get("inner-id")->session_id == "inner-id");
    assert(cache.get("missing") == nullptr);

    // Records outlive their files
    fs::remove(file);
    cache.refresh();
    assert(cache.get("file-stem") != nullptr);
    assert(cache.size() == 1);

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_cache_missing_root() {
    std::cout << "Testing cache without projects root..." << std::endl;

    ConversationCache cache("/nonexistent/smriti/projects");
    auto stats = cache.refresh();
    assert(stats.scanned == 0);
    assert(cache.size() == 0);
    assert(list_project_names("/nonexistent/smriti/projects").empty());

    std::cout << "  PASS" << std::endl;
}

void test_cache_same_stem_in_two_projects() {
    std::cout << "Testing cache with one file name in two projects..." << std::endl;

    fs::path root = make_temp_root();
    fs::path a = root / "proj-a" / "same.jsonl";
    fs::path b = root / "proj-b" / "same.jsonl";
    write_transcript(a, {user_line("alpha work", "t1", "id-proj-a")});
    write_transcript(b, {user_line("beta work", "t2", "id-proj-b")});

    // The older file must not be judged fresh against the newer one
    auto base = fs::file_time_type::clock::now() - std::chrono::hours(1);
    fs::last_write_time(a, base);
    fs::last_write_time(b, base - std::chrono::minutes(10));

    ConversationCache cache(root);
    auto stats = cache.refresh();
    assert(stats.scanned == 2);
    assert(stats.parsed == 2);
    assert(cache.size() == 2);

    const ConversationRecord* ra = cache.get("id-proj-a");
    const ConversationRecord* rb = cache.get("id-proj-b");
    assert(ra != nullptr && ra->project == "proj-a");
    assert(rb != nullptr && rb->project == "proj-b");
    assert(cache.get("proj-b/same") == rb);
    // A bare stem resolves to the first project in key order
    assert(cache.get("same") == ra);

    cache.refresh();
    assert(cache.parse_count() == 2);

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// QueryEngine
// ═══════════════════════════════════════════════════════════════════════════

ConversationRecord record_with_todos(const std::string& id, const std::string& project,
                                     const std::string& ts, FinalTodos todos) {
    ConversationRecord r;
    r.session_id = id;
    r.project = project;
    r.timestamp = ts;
    r.final_todos = std::move(todos);
    return r;
}

void test_query_term_counting() {
    std::cout << "Testing query term counting..." << std::endl;

    assert(split_terms("  A   b\tC ") == (Strings{"a", "b", "c"}));
    assert(score_text("a-b-c", split_terms("a b")) == 2);
    assert(score_text("Refactor PARSER", split_terms("parser")) == 1);
    assert(score_text("nothing here", split_terms("parser")) == 0);

    FinalTodos todos;
    todos.completed = {"a-b-c"};
    ConversationRecord r = record_with_todos("s", "p", "t", todos);
    auto results = rank_records({&r}, "a b", 10);
    assert(results.size() == 1);
    assert(results[0].score == 2);
    assert(results[0].matched_todos == (Strings{"a-b-c"}));

    assert(rank_records({&r}, "", 10).empty());
    assert(rank_records({&r}, "zzz", 10).empty());

    std::cout << "  PASS" << std::endl;
}

void test_query_ranking() {
    std::cout << "Testing query ranking..." << std::endl;

    FinalTodos strong;
    strong.completed = {"Add OAuth login", "Fix oauth refresh"};
    strong.pending = {"Write docs"};
    FinalTodos weak_old;
    weak_old.in_progress = {"oauth cleanup"};
    FinalTodos weak_new;
    weak_new.pending = {"OAuth scopes"};

    auto r1 = record_with_todos("strong", "web", "2025-01-01T00:00:00Z", strong);
    auto r2 = record_with_todos("weak-old", "web", "2025-01-02T00:00:00Z", weak_old);
    auto r3 = record_with_todos("weak-new", "cli", "2025-03-01T00:00:00Z", weak_new);
    ConversationRecord r4;
    r4.session_id = "arc";
    r4.project = "cli";
    r4.timestamp = "2025-02-01T00:00:00Z";
    r4.user_message_arc = {"please look at the oauth flow", "thanks"};

    std::vector<const ConversationRecord*> records = {&r2, &r4, &r1, &r3};
    auto results = rank_records(records, "oauth", 10);
    assert(results.size() == 4);
    assert(results[0].session_id == "strong");
    assert(results[0].score == 2);
    assert(results[0].summary == "Add OAuth login; Fix oauth refresh");
    assert(results[1].session_id == "weak-new");
    assert(results[2].session_id == "arc");
    assert(results[2].matched_user_messages ==
           (Strings{"please look at the oauth flow"}));
    assert(results[2].matched_todos.empty());
    assert(results[2].summary == "please look at the oauth flow ... thanks");
    assert(results[3].session_id == "weak-old");
    assert(results[3].summary == "oauth cleanup");

    auto limited = rank_records(records, "oauth", 2);
    assert(limited.size() == 2);

    auto filtered = rank_records(records, "oauth", 10, "cli");
    assert(filtered.size() == 2);
    assert(filtered[0].project == "cli" && filtered[1].project == "cli");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// NavigationService
// ═══════════════════════════════════════════════════════════════════════════

void test_navigation_absolute_range() {
    std::cout << "Testing navigation absolute range..." << std::endl;

    Transcript t = build_transcript(entries_of(twenty_messages()));
    assert(t.messages.size() == 20);

    auto w = select_range(t, 5, 5, 3);
    assert(w.actual_start == 2 && w.actual_end == 8);
    assert(w.messages.size() == 6);
    assert(w.messages.front().index == 2);
    assert(w.can_expand_before && w.can_expand_after);

    auto head = select_range(t, 0, 3, 5);
    assert(head.actual_start == 0 && head.actual_end == 8);
    assert(!head.can_expand_before && head.can_expand_after);

    auto tail = select_range(t, 18, 40, 0);
    assert(tail.actual_start == 18 && tail.actual_end == 20);
    assert(tail.can_expand_before && !tail.can_expand_after);

    auto past_end = select_range(t, 30, 35, 1);
    assert(past_end.messages.empty());
    assert(past_end.actual_start == 20 && past_end.actual_end == 20);

    auto users = select_range(t, 0, 20, 0, Role::User);
    assert(users.messages.size() == 10);
    assert(users.total_messages == 20);

    std::cout << "  PASS" << std::endl;
}

void test_navigation_turn_range() {
    std::cout << "Testing navigation turn range..." << std::endl;

    auto lines = twenty_messages();
    // Tool results inherit the current turn instead of starting one
    lines.insert(lines.begin() + 2, tool_result_line());
    lines.insert(lines.begin(), assistant_line("preamble"));
    Transcript t = build_transcript(entries_of(lines));
    assert(t.messages.size() == 22);
    assert(t.total_user_turns == 10);
    assert(t.messages[0].turn == 0);
    assert(t.messages[1].turn == 1);
    assert(t.messages[3].turn == 1);
    assert(t.messages[4].turn == 2);

    auto w = select_turns(t, 5, 1);
    assert(w.first_turn == 4 && w.last_turn == 6);
    assert(w.messages.size() == 6);
    for (const auto& m : w.messages) assert(m.turn >= 4 && m.turn <= 6);
    assert(w.can_expand_before && w.can_expand_after);

    auto edge = select_turns(t, 1, 2);
    assert(edge.first_turn == 1 && edge.last_turn == 3);
    assert(!edge.can_expand_before && edge.can_expand_after);
    assert(edge.messages.front().index == 1);

    auto assistant_only = select_turns(t, 10, 0, Role::Assistant);
    assert(assistant_only.messages.size() == 1);
    assert(assistant_only.messages[0].content == "answer 10");
    assert(!assistant_only.can_expand_after);

    auto none = select_turns(t, 40, 2);
    assert(none.messages.empty());
    assert(none.first_turn == 0);

    std::cout << "  PASS" << std::endl;
}

void test_navigation_tail() {
    std::cout << "Testing navigation tail..." << std::endl;

    Transcript t = build_transcript(entries_of(twenty_messages()));

    auto w = select_tail(t, 5);
    assert(w.actual_start == 15 && w.actual_end == 20);
    assert(w.messages.size() == 5);
    assert(w.messages.front().index == 15);
    assert(w.messages.back().content == "answer 10");
    assert(w.can_expand_before && !w.can_expand_after);

    auto all = select_tail(t, 50);
    assert(all.actual_start == 0 && all.messages.size() == 20);
    assert(!all.can_expand_before);

    auto users = select_tail(t, 4, Role::User);
    assert(users.messages.size() == 2);
    assert(users.messages[0].content == "question 9");

    auto none = select_tail(t, 0);
    assert(none.messages.empty());
    assert(none.actual_start == 20);

    std::cout << "  PASS" << std::endl;
}

void test_navigation_extreme_arguments() {
    std::cout << "Testing navigation with extreme arguments..." << std::endl;

    const long long big = std::numeric_limits<long long>::max();
    const long long lowest = std::numeric_limits<long long>::min();
    Transcript t = build_transcript(entries_of({
        user_line("one"), assistant_line("reply one"),
        user_line("two"), assistant_line("reply two")
    }));
    assert(t.messages.size() == 4);
    assert(t.total_user_turns == 2);

    auto open_end = select_range(t, 0, big, 1);
    assert(open_end.actual_start == 0 && open_end.actual_end == 4);
    assert(open_end.messages.size() == 4);
    assert(!open_end.can_expand_after);

    auto far = select_range(t, big, big, 0);
    assert(far.messages.empty());
    assert(far.actual_start == 4 && far.actual_end == 4);

    auto wide = select_range(t, 2, 3, std::numeric_limits<size_t>::max());
    assert(wide.actual_start == 0 && wide.actual_end == 4);

    auto before = select_range(t, lowest, lowest, 1);
    assert(before.actual_start == 0 && before.actual_end == 1);

    auto late_turn = select_turns(t, big, 1);
    assert(late_turn.messages.empty());

    auto all_turns = select_turns(t, 1, std::numeric_limits<size_t>::max());
    assert(all_turns.first_turn == 1 && all_turns.last_turn == 2);
    assert(all_turns.messages.size() == 4);

    auto early_turn = select_turns(t, lowest, 2);
    assert(early_turn.messages.empty());

    assert(saturating_add(big, 1) == big);
    assert(saturating_add(big - 1, 1) == big);
    assert(saturating_add(-5, 3) == -2);

    std::cout << "  PASS" << std::endl;
}

void test_navigation_matches_chapter_indices() {
    std::cout << "Testing chapter ranges against navigation..." << std::endl;

    std::vector<json> lines = {
        user_line("build the parser"),                                   // 1
        todo_line({{"parser", "in_progress"}, {"tests", "pending"}}),     // 2
        assistant_line("writing"),                                       // 3
        tool_result_line(),                                              // 4
        todo_line({{"parser", "completed"}, {"tests", "in_progress"}}),   // 5
        assistant_line("now tests"),                                     // 6
        todo_line({{"parser", "completed"}, {"tests", "completed"}})      // 7
    };
    auto entries = entries_of(lines);
    auto record = extract_conversation(entries);
    auto chapters = segment_chapters(record.todo_snapshots);
    assert(chapters.size() == 2);
    assert(chapters[0].range_start == 0 && chapters[0].range_end == 5);
    assert(chapters[1].range_start == 5 && chapters[1].range_end == 7);

    Transcript t = build_transcript(entries);
    assert(t.messages.size() == record.message_count);
    auto w = select_range(t, chapters[1].range_start, chapters[1].range_end, 0);
    assert(w.messages.size() == 2);
    assert(w.messages[0].content == "now tests");
    assert(w.messages[1].tools == (Strings{"TodoWrite"}));

    std::cout << "  PASS" << std::endl;
}

void test_navigation_service_not_found() {
    std::cout << "Testing navigation not found..." << std::endl;

    fs::path root = make_temp_root();
    fs::path file = root / "proj" / "gone.jsonl";
    write_transcript(file, twenty_messages());

    ConversationCache cache(root);
    cache.refresh();
    NavigationService nav(cache);

    MessageWindow w;
    std::string err;
    assert(nav.context("gone", 5, 5, 3, std::nullopt, w, err));
    assert(w.actual_start == 2 && w.actual_end == 8);

    assert(!nav.context("unknown", 0, 1, 0, std::nullopt, w, err));
    assert(err.find("not found") != std::string::npos);

    fs::remove(file);
    cache.refresh();
    err.clear();
    assert(!nav.turn_context("gone", 1, 1, std::nullopt, w, err));
    assert(err.find("missing") != std::string::npos);

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// MCP surface
// ═══════════════════════════════════════════════════════════════════════════

json rpc(mcp::Handler& handler, const std::string& method, const json& params, int id) {
    json req = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
    return json::parse(handler.handle(req.dump()));
}

void test_mcp_tools() {
    std::cout << "Testing MCP tools..." << std::endl;

    fs::path root = make_temp_root();
    auto lines = twenty_messages();
    lines.push_back(todo_line({{"Ship search", "completed"}, {"Write docs", "pending"}}));
    write_transcript(root / "proj" / "sess-1.jsonl", lines);
    write_transcript(root / "other" / "sess-2.jsonl", {user_line("unrelated work")});

    Config config;
    config.projects_path = root.string();
    auto ctx = std::make_shared<mcp::tools::sessions::ToolContext>(config);
    mcp::Handler handler(ctx);

    auto init = rpc(handler, "initialize", json::object(), 1);
    assert(init["result"]["serverInfo"]["name"] == "smriti");

    auto list = rpc(handler, "tools/list", json::object(), 2);
    assert(list["result"]["tools"].size() == 8);

    auto search = rpc(handler, "tools/call",
                      {{"name", "search_conversations"}, {"arguments", {{"query", "search docs"}}}}, 3);
    auto structured = search["result"]["structuredContent"];
    assert(search["result"]["isError"] == false);
    assert(structured["success"] == true);
    assert(structured["results"].size() == 1);
    assert(structured["results"][0]["sessionId"] == "sess-1");
    assert(structured["results"][0]["score"] == 2);

    auto session = handler.call_tool("get_session", {{"session_id", "sess-1"}});
    assert(!session.is_error);
    assert(session.structured["chapters"].size() == 1);
    assert(session.structured["chapters"][0]["messageRange"] == json::array({0, 21}));
    assert(session.structured["finalTodos"]["pending"][0] == "Write docs");

    auto ctx_window = handler.call_tool("get_conversation_context",
                                        {{"session_id", "sess-1"}, {"start", 5}, {"end", 5}, {"expand", 3}});
    assert(ctx_window.structured["actualStart"] == 2);
    assert(ctx_window.structured["actualEnd"] == 8);
    assert(ctx_window.structured["canExpandBefore"] == true);

    auto around = handler.call_tool("get_conversation",
                                    {{"session_id", "sess-1"}, {"around_message", 0}, {"context_size", 2}});
    assert(around.structured["messageCount"] == 3);
    assert(around.structured["truncated"] == true);

    auto tail = handler.call_tool("get_conversation", {{"session_id", "sess-1"}, {"max_messages", 5}});
    assert(tail.structured["messageCount"] == 5);
    assert(tail.structured["actualStart"] == 16);
    assert(tail.structured["canExpandBefore"] == true);
    assert(tail.structured["canExpandAfter"] == false);
    assert(tail.structured["project"] == "proj");
    assert(tail.structured["file"] == "sess-1.jsonl");

    auto recent_only = handler.call_tool("get_conversation",
                                         {{"session_id", "sess-1"}, {"recent_only", true}});
    assert(recent_only.structured["messageCount"] == 20);
    assert(recent_only.structured["actualStart"] == 1);
    assert(recent_only.structured["truncated"] == true);

    auto whole = handler.call_tool("get_conversation", {{"session_id", "sess-1"}});
    assert(whole.structured["messageCount"] == 21);
    assert(whole.structured["truncated"] == false);

    const long long big = std::numeric_limits<long long>::max();
    auto far_around = handler.call_tool("get_conversation",
                                        {{"session_id", "sess-1"}, {"around_message", big}});
    assert(!far_around.is_error);
    assert(far_around.structured["messageCount"] == 0);
    auto far_start = handler.call_tool("get_conversation_context",
                                       {{"session_id", "sess-1"}, {"start", big}});
    assert(far_start.structured["actualStart"] == 21);
    assert(far_start.structured["actualEnd"] == 21);
    auto open_end = handler.call_tool("get_conversation_context",
                                      {{"session_id", "sess-1"}, {"start", 0}, {"end", big}, {"expand", 1}});
    assert(open_end.structured["actualEnd"] == 21);
    assert(open_end.structured["messageCount"] == 21);

    auto turns = handler.call_tool("get_turn_context",
                                   {{"session_id", "sess-1"}, {"turn", 2}, {"radius", 0}, {"role", "user"}});
    assert(turns.structured["messages"].size() == 1);
    assert(turns.structured["messages"][0]["content"] == "question 2");

    auto bad_role = handler.call_tool("get_turn_context",
                                      {{"session_id", "sess-1"}, {"turn", 2}, {"role", "system"}});
    assert(bad_role.is_error);

    auto missing = handler.call_tool("get_session", {{"session_id", "nope"}});
    assert(missing.is_error);
    assert(missing.structured["success"] == false);
    assert(missing.structured["error"] == "Conversation nope not found");

    auto no_param = handler.call_tool("get_chapter", {{"session_id", "sess-1"}});
    assert(no_param.is_error);

    auto recent = handler.call_tool("list_recent", {{"limit", 1}});
    assert(recent.structured["conversations"].size() == 1);

    auto projects = handler.call_tool("list_projects", json::object());
    assert(projects.structured["projects"] == json::array({"other", "proj"}));

    // Notifications get no response; garbage gets a parse error
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").empty());
    auto garbage = json::parse(handler.handle("{oops"));
    assert(garbage["error"]["code"] == mcp::error::PARSE_ERROR);
    auto unknown = rpc(handler, "tools/call", {{"name", "nope"}}, 4);
    assert(unknown["error"]["code"] == mcp::error::TOOL_NOT_FOUND);

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_mcp_server_loop() {
    std::cout << "Testing MCP stdio loop..." << std::endl;

    Config config;
    config.projects_path = "/nonexistent/smriti/projects";
    auto ctx = std::make_shared<mcp::tools::sessions::ToolContext>(config);
    MCPServer server(ctx);

    std::istringstream in(
        R"({"jsonrpc":"2.0","method":"initialize","id":1})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","method":"ping","id":2})" "\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream responses(out.str());
    std::string line;
    std::vector<json> parsed;
    while (std::getline(responses, line)) parsed.push_back(json::parse(line));
    assert(parsed.size() == 2);
    assert(parsed[0]["id"] == 1);
    assert(parsed[1]["id"] == 2);

    std::cout << "  PASS" << std::endl;
}

void test_mcp_list_recent_order() {
    std::cout << "Testing list_recent ordering..." << std::endl;

    fs::path root = make_temp_root();
    fs::path oldest = root / "web" / "oldest.jsonl";
    fs::path newest = root / "cli" / "newest.jsonl";
    fs::path middle = root / "web" / "middle.jsonl";
    write_transcript(oldest, {user_line("first try")});
    write_transcript(newest, {user_line("latest idea")});
    write_transcript(middle, {user_line("second try")});

    auto base = fs::file_time_type::clock::now();
    fs::last_write_time(oldest, base - std::chrono::hours(3));
    fs::last_write_time(newest, base - std::chrono::hours(1));
    fs::last_write_time(middle, base - std::chrono::hours(2));

    Config config;
    config.projects_path = root.string();
    auto ctx = std::make_shared<mcp::tools::sessions::ToolContext>(config);
    mcp::Handler handler(ctx);

    auto recent = handler.call_tool("list_recent", json::object());
    const auto& list = recent.structured["conversations"];
    assert(list.size() == 3);
    assert(list[0]["sessionId"] == "newest");
    assert(list[0]["project"] == "cli");
    assert(list[0]["firstMessage"] == "latest idea");
    assert(list[1]["sessionId"] == "middle");
    assert(list[2]["sessionId"] == "oldest");
    for (const auto& entry : list) {
        std::string modified = entry["lastModified"];
        assert(modified.size() == 19);
        assert(modified[4] == '-' && modified[10] == 'T' && modified[13] == ':');
    }

    auto limited = handler.call_tool("list_recent", {{"limit", 2}});
    assert(limited.structured["conversations"].size() == 2);
    assert(limited.structured["conversations"][1]["sessionId"] == "middle");

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_mcp_text_previews_keep_characters() {
    std::cout << "Testing text previews with multi-byte characters..." << std::endl;

    fs::path root = make_temp_root();
    std::string accented;
    for (int i = 0; i < 250; ++i) accented += "\xC3\xA9";
    // One ASCII byte first puts every even byte offset inside a character
    std::string text = "x" + accented;
    write_transcript(root / "proj" / "accents.jsonl", {user_line(text), assistant_line(text)});

    Config config;
    config.projects_path = root.string();
    auto ctx = std::make_shared<mcp::tools::sessions::ToolContext>(config);
    mcp::Handler handler(ctx);
    const std::string replacement = "\xEF\xBF\xBD";

    auto conversation = handler.call_tool("get_conversation", {{"session_id", "accents"}});
    assert(!conversation.is_error);
    assert(conversation.content.find(replacement) == std::string::npos);
    assert(conversation.content.find("...") != std::string::npos);

    auto search = handler.call_tool("search_conversations", {{"query", "\xC3\xA9"}});
    assert(search.structured["results"].size() == 1);
    assert(search.content.find(replacement) == std::string::npos);
    assert(search.content.find("...") != std::string::npos);

    auto recent = handler.call_tool("list_recent", json::object());
    assert(recent.content.find(replacement) == std::string::npos);

    fs::remove_all(root);
    std::cout << "  PASS" << std::endl;
}

void test_mcp_server_survives_invalid_utf8() {
    std::cout << "Testing MCP stdio loop with invalid UTF-8..." << std::endl;

    Config config;
    config.projects_path = "/nonexistent/smriti/projects";
    auto ctx = std::make_shared<mcp::tools::sessions::ToolContext>(config);
    MCPServer server(ctx);

    std::string bad = std::string(R"({"jsonrpc":"2.0","method":"ping","id":")") + "\xff" + "\xfe" + "\"}";
    std::istringstream in(bad + "\n" + R"({"jsonrpc":"2.0","method":"ping","id":2})" + "\n");
    std::ostringstream out;
    server.run(in, out);

    std::istringstream responses(out.str());
    std::string line;
    std::vector<json> parsed;
    while (std::getline(responses, line)) parsed.push_back(json::parse(line));
    assert(parsed.size() == 2);
    assert(parsed[0]["error"]["code"] == mcp::error::PARSE_ERROR);
    assert(parsed[0]["id"].is_null());
    assert(parsed[1]["id"] == 2);
    assert(parsed[1].contains("result"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Smriti Tests ===" << std::endl;
    std::cout << std::endl;

    test_entry_parser_skips_malformed_lines();
    test_entry_parser_missing_file();
    test_entry_parser_content_shapes();

    test_extractor_indices_follow_raw_positions();
    test_extractor_marker_is_substring();
    test_extractor_final_todos_last_snapshot_only();
    test_user_arc();
    test_no_snapshots_summary_from_arc();

    test_chapters_chain_in_completion_order();
    test_chapters_same_snapshot_zero_width();
    test_chapters_dedupe_reopened_todo();

    test_cache_refresh_skips_unchanged_files();
    test_cache_lookup_and_deleted_files();
    test_cache_missing_root();
    test_cache_same_stem_in_two_projects();

    test_query_term_counting();
    test_query_ranking();

    test_navigation_absolute_range();
    test_navigation_turn_range();
    test_navigation_tail();
    test_navigation_extreme_arguments();
    test_navigation_matches_chapter_indices();
    test_navigation_service_not_found();

    std::cout << std::endl;
    std::cout << "=== MCP Tests ===" << std::endl;
    test_mcp_tools();
    test_mcp_list_recent_order();
    test_mcp_text_previews_keep_characters();
    test_mcp_server_loop();
    test_mcp_server_survives_invalid_utf8();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
