// Smriti - session transcript index
//
// Modes:
//   Server mode: smriti [options]                  - MCP over stdio
//   CLI mode:    smriti <tool> [args...] [options] - Run one tool and print the result
//
// CLI Examples:
//   smriti search_conversations "oauth refresh"
//   smriti search_conversations "mobile menu" --project -home-me-app --limit 5
//   smriti get_session 0f3c9a7e-...
//   smriti get_conversation_context 0f3c9a7e-... --start 40 --end 45 --expand 3
//   smriti list_recent --json
//
// Options:
//   --projects PATH   Projects root (default: $SMRITI_PROJECTS_PATH or ~/.claude/projects)
//   --verbose, -v     Debug logging on stderr
//   --json            CLI mode: print the structured payload instead of text

#include <smriti/mcp.hpp>
#include <smriti/config.hpp>
#include <smriti/log.hpp>
#include <smriti/version.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;

void print_usage(const char* prog) {
    std::cerr << "smriti " << SMRITI_VERSION << " - session transcript index\n\n"
              << "Usage:\n"
              << "  " << prog << " [options]                 MCP server on stdio\n"
              << "  " << prog << " <tool> [args...] [options] Run one tool\n"
              << "\n"
              << "Tools: search_conversations, get_session, get_conversation,\n"
              << "       get_conversation_context, get_turn_context, get_chapter,\n"
              << "       list_recent, list_projects\n"
              << "\n"
              << "Options:\n"
              << "  --projects PATH   Projects root (default: ~/.claude/projects)\n"
              << "  --verbose, -v     Debug logging on stderr\n"
              << "  --json            CLI mode: print structured JSON instead of text\n"
              << "  --help, -h        Show this help message\n";
}

// Turn a CLI value into the JSON type a tool expects
json parse_cli_value(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;

    bool is_integer = !value.empty();
    for (size_t j = 0; j < value.size(); ++j) {
        char c = value[j];
        if (c == '-' && j == 0 && value.size() > 1) continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) { is_integer = false; break; }
    }
    if (is_integer) {
        try {
            return std::stoll(value);
        } catch (const std::out_of_range&) {
            return value;
        }
    }
    return value;
}

std::string positional_key(const std::string& tool) {
    if (tool == "search_conversations") return "query";
    if (tool == "list_recent" || tool == "list_projects") return "";
    return "session_id";
}

// CLI mode: invoke one tool in-process
int run_cli(smriti::MCPServer& server, const std::string& tool,
            int argc, char* argv[], int arg_start, bool json_output) {
    json args = json::object();
    std::string key_for_positional = positional_key(tool);
    bool found_positional = false;

    for (int i = arg_start; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--json" || arg == "--verbose" || arg == "-v") continue;
        if (arg == "--projects") { ++i; continue; }

        if (arg.rfind("--", 0) == 0) {
            std::string key = arg.substr(2);
            // Values may be negative numbers, so only "--" marks the next option
            if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
                args[key] = parse_cli_value(argv[++i]);
            } else {
                args[key] = true;
            }
        } else if (!found_positional && !key_for_positional.empty()) {
            args[key_for_positional] = arg;
            found_positional = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    smriti::mcp::ToolResult result = server.handler().call_tool(tool, args);

    if (json_output) {
        std::cout << result.structured.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else if (result.is_error) {
        std::cerr << "Error: " << result.content << "\n";
    } else {
        std::cout << result.content << "\n";
    }
    return result.is_error ? 1 : 0;
}

int main(int argc, char* argv[]) {
    smriti::Config config = smriti::Config::from_env();
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--projects") == 0 && i + 1 < argc) {
            config.projects_path = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }
    smriti::set_verbose(config.verbose);

    auto context = std::make_shared<smriti::mcp::tools::sessions::ToolContext>(config);
    smriti::MCPServer server(context);

    // CLI mode: first arg names a tool
    if (argc > 1 && argv[1][0] != '-') {
        std::string tool = argv[1];
        if (!server.handler().has_tool(tool)) {
            std::cerr << "Unknown tool: " << tool << "\n";
            print_usage(argv[0]);
            return 1;
        }
        return run_cli(server, tool, argc, argv, 2, json_output);
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--projects") == 0) {
            ++i;
        } else if (std::strcmp(argv[i], "--verbose") != 0 && std::strcmp(argv[i], "-v") != 0 &&
                   std::strcmp(argv[i], "--json") != 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cerr << "[smriti] " << SMRITI_VERSION << " indexing " << config.projects_path << "\n";
    std::cerr << "[smriti] Listening on stdin...\n";

    server.run();

    std::cerr << "[smriti] Shutdown complete\n";
    return 0;
}
