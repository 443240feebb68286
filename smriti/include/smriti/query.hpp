#pragma once
// QueryEngine: literal term scoring over cached records
//
// A query is split into lowercase whitespace-separated terms. Each
// candidate text of a record (its todos, or its user-message arc when it
// has none) adds one point per term it contains as a case-insensitive
// substring. No tokenization, stemming or positional weighting.

#include "types.hpp"
#include "cache.hpp"
#include "extractor.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace smriti {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::vector<std::string> split_terms(const std::string& query) {
    std::vector<std::string> terms;
    std::istringstream iss(to_lower(query));
    std::string term;
    while (iss >> term) {
        terms.push_back(term);
    }
    return terms;
}

inline int score_text(const std::string& text, const std::vector<std::string>& terms) {
    std::string lowered = to_lower(text);
    int score = 0;
    for (const auto& term : terms) {
        if (lowered.find(term) != std::string::npos) ++score;
    }
    return score;
}

// Todos when the record has any, else the user-message arc
inline std::vector<std::string> candidate_texts(const ConversationRecord& record) {
    if (!record.final_todos.empty()) return all_todos(record.final_todos);
    return record.user_message_arc;
}

inline std::vector<SearchResult> rank_records(const std::vector<const ConversationRecord*>& records,
                                              const std::string& query,
                                              size_t limit,
                                              const std::string& project_filter = "") {
    std::vector<std::string> terms = split_terms(query);
    std::vector<SearchResult> results;
    if (terms.empty()) return results;

    for (const auto* record : records) {
        if (!project_filter.empty() && record->project != project_filter) continue;

        bool from_todos = !record->final_todos.empty();
        SearchResult result;
        for (const auto& text : candidate_texts(*record)) {
            int s = score_text(text, terms);
            if (s == 0) continue;
            result.score += s;
            if (from_todos) {
                result.matched_todos.push_back(text);
            } else {
                result.matched_user_messages.push_back(text);
            }
        }
        if (result.score == 0) continue;

        result.session_id = record->session_id;
        result.summary = record_summary(*record);
        result.project = record->project;
        result.timestamp = record->timestamp;
        results.push_back(std::move(result));
    }

    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.session_id < b.session_id;
    });

    if (results.size() > limit) results.resize(limit);
    return results;
}

class QueryEngine {
public:
    explicit QueryEngine(const ConversationCache& cache) : cache_(cache) {}

    std::vector<SearchResult> search(const std::string& query, size_t limit,
                                     const std::string& project_filter = "") const {
        return rank_records(cache_.records(), query, limit, project_filter);
    }

private:
    const ConversationCache& cache_;
};

} // namespace smriti
