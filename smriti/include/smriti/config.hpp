#pragma once
// Config: where transcripts live and how chatty we are
//
// Defaults come from the environment; command-line flags override them.
//   SMRITI_PROJECTS_PATH  projects root (default: ~/.claude/projects)
//   SMRITI_VERBOSE        any value other than "0" enables debug logging

#include <cstddef>
#include <cstdlib>
#include <string>

namespace smriti {

struct Config {
    std::string projects_path;          // One subdirectory per project
    bool verbose = false;
    size_t default_search_limit = 20;
    size_t default_recent_limit = 10;
    size_t default_context_size = 10;   // get_conversation around_message radius
    size_t recent_only_count = 20;      // get_conversation recent_only tail

    static std::string default_projects_path() {
        const char* home = std::getenv("HOME");
        if (!home) home = ".";
        return std::string(home) + "/.claude/projects";
    }

    static Config from_env() {
        Config config;
        config.projects_path = default_projects_path();
        if (const char* env_path = std::getenv("SMRITI_PROJECTS_PATH")) {
            if (*env_path) config.projects_path = env_path;
        }
        if (const char* env_verbose = std::getenv("SMRITI_VERBOSE")) {
            config.verbose = std::string(env_verbose) != "0";
        }
        return config;
    }
};

} // namespace smriti
