#pragma once
// ChapterSegmenter: todo completions → ordered, chained chapters
//
// Walk snapshots in order and their todos in list order. Each completed
// todo whose text has not been seen before closes a chapter at the
// snapshot's message index; the next chapter starts where it ended.
//
// Two new completions in the same snapshot both close at that snapshot's
// index, so the second one gets a zero-width range. Kept as is pending a
// product decision; see DESIGN.md.

#include "types.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace smriti {

inline std::vector<Chapter> segment_chapters(const std::vector<TodoSnapshot>& snapshots) {
    std::vector<Chapter> chapters;
    std::unordered_set<std::string> seen;
    size_t boundary = 0;

    for (const auto& snapshot : snapshots) {
        for (const auto& todo : snapshot.todos) {
            if (todo.status != TodoStatus::Completed) continue;
            if (!seen.insert(todo.content).second) continue;

            Chapter chapter;
            chapter.title = todo.content;
            chapter.range_start = boundary;
            chapter.range_end = snapshot.message_index;
            chapter.completed_at = snapshot.message_index;
            chapter.message_count = snapshot.message_index - boundary;
            chapters.push_back(std::move(chapter));

            boundary = snapshot.message_index;
        }
    }

    return chapters;
}

} // namespace smriti
