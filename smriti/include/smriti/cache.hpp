#pragma once
// ConversationCache: transcript file → ConversationRecord, refreshed by mtime
//
// Every refresh stats each candidate transcript. A file that is not cached
// yet, or whose on-disk mtime is newer than the stored one, is parsed again
// from scratch and its record replaced wholesale. Nothing is merged.
//
// Records whose file disappeared stay cached; see DESIGN.md.
// No locking: one caller, one request at a time.

#include "types.hpp"
#include "log.hpp"
#include "entry_parser.hpp"
#include "extractor.hpp"
#include "chapters.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace smriti {

namespace fs = std::filesystem;

constexpr const char* TRANSCRIPT_EXTENSION = ".jsonl";

// A transcript on disk and the project directory it belongs to
struct SessionFile {
    fs::path path;
    std::string project;
};

// Project directory names under root, sorted
inline std::vector<std::string> list_project_names(const fs::path& root) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        log_debug("Cache", "cannot list %s: %s", root.string().c_str(), ec.message().c_str());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Transcripts of one project, or of every project when project is empty
inline std::vector<SessionFile> scan_session_files(const fs::path& root,
                                                   const std::string& project = "") {
    std::vector<SessionFile> files;
    std::vector<std::string> projects;
    if (project.empty()) {
        projects = list_project_names(root);
    } else {
        projects.push_back(project);
    }

    for (const auto& name : projects) {
        std::error_code ec;
        fs::path dir = root / name;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;
            if (it->path().extension() != TRANSCRIPT_EXTENSION) continue;
            files.push_back({it->path(), name});
        }
        if (ec) {
            log_debug("Cache", "cannot list %s: %s", dir.string().c_str(), ec.message().c_str());
        }
    }

    std::sort(files.begin(), files.end(), [](const SessionFile& a, const SessionFile& b) {
        return a.path < b.path;
    });
    return files;
}

// Cache key: "<project>/<stem>". The stem alone repeats across projects.
inline std::string record_key(const SessionFile& file) {
    return file.project + "/" + file.path.stem().string();
}

inline ConversationRecord build_record(const SessionFile& file, fs::file_time_type mtime) {
    auto entries = parse_jsonl_file(file.path.string());
    ConversationRecord record = extract_conversation(entries, file.path.string(), file.project);
    record.chapters = segment_chapters(record.todo_snapshots);
    record.mtime = mtime;
    if (record.session_id.empty()) {
        record.session_id = file.path.stem().string();
    }
    return record;
}

class ConversationCache {
public:
    struct RefreshStats {
        size_t scanned = 0;     // Candidate files looked at
        size_t parsed = 0;      // Files re-extracted
        size_t failed = 0;      // Files whose mtime could not be read
    };

    ConversationCache() = default;
    explicit ConversationCache(fs::path projects_root) : root_(std::move(projects_root)) {}

    // Scan the projects root and refresh everything found there
    RefreshStats refresh() {
        return refresh_files(scan_session_files(root_));
    }

    RefreshStats refresh_files(const std::vector<SessionFile>& files) {
        RefreshStats stats;
        for (const auto& file : files) {
            ++stats.scanned;

            std::error_code ec;
            auto disk_mtime = fs::last_write_time(file.path, ec);
            if (ec) {
                log_error("Cache", "cannot stat %s: %s",
                          file.path.string().c_str(), ec.message().c_str());
                ++stats.failed;
                continue;
            }

            std::string key = record_key(file);
            auto it = records_.find(key);
            if (it != records_.end() && it->second.mtime >= disk_mtime) {
                continue;
            }

            records_[key] = build_record(file, disk_mtime);
            ++parse_count_;
            ++stats.parsed;
        }

        if (stats.parsed > 0) {
            log_debug("Cache", "refresh: %zu scanned, %zu parsed, %zu cached",
                      stats.scanned, stats.parsed, records_.size());
        }
        return stats;
    }

    // Lookup by "<project>/<stem>", else by the id recorded inside the
    // transcript or by the bare file stem. When several records match, the
    // smallest key wins.
    const ConversationRecord* get(const std::string& session_id) const {
        auto it = records_.find(session_id);
        if (it != records_.end()) return &it->second;

        const std::string* best_key = nullptr;
        const ConversationRecord* best = nullptr;
        for (const auto& [key, record] : records_) {
            if (record.session_id != session_id &&
                fs::path(record.file_path).stem().string() != session_id) {
                continue;
            }
            if (!best_key || key < *best_key) {
                best_key = &key;
                best = &record;
            }
        }
        return best;
    }

    std::vector<const ConversationRecord*> records() const {
        std::vector<const ConversationRecord*> out;
        out.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            out.push_back(&record);
        }
        return out;
    }

    size_t size() const { return records_.size(); }
    size_t parse_count() const { return parse_count_; }
    const fs::path& projects_root() const { return root_; }

private:
    fs::path root_;
    std::unordered_map<std::string, ConversationRecord> records_;
    size_t parse_count_ = 0;
};

} // namespace smriti
