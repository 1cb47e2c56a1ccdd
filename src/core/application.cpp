/*
 * dailies C++17 - Application Implementation
 */
#include <dailies/core/application.hpp>
#include <dailies/core/logger.hpp>
#include <dailies/core/utils.hpp>
#include <dailies/chat/transcript.hpp>

#include <iostream>
#include <cstring>

namespace dailies {

const char* const AppInfo::NAME = "dailies-org";
const char* const AppInfo::VERSION = "0.3.0";

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - gptel org-mode conversation converter\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  parse  <file.org|dir>               Print conversations as JSON\n"
              << "  build  <conversations.json> [out]   Write an annotated org file\n"
              << "  import <history.csv> [out_dir]      One org file per day (default: output)\n\n"
              << "Options:\n"
              << "  -c, --config FILE  JSON configuration\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application() : exit_code_(0) {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << argv[i] << "\n";
                exit_code_ = 2;
                return false;
            }
            config_file_ = argv[++i];
            continue;
        }
        if (command_.empty()) {
            command_ = argv[i];
        } else {
            args_.push_back(argv[i]);
        }
    }

    if (command_.empty()) {
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    std::string name = config_.get_string("log_level", "info");
    LogLevel level;
    if (parse_log_level(name, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s', keeping info", name.c_str());
    }
}

bool Application::init(int argc, char* argv[]) {
    // Each init() starts from a clean command line
    config_ = Config();
    config_file_.clear();
    command_.clear();
    args_.clear();
    exit_code_ = 0;

    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config: %s", config_.last_error().c_str());
            exit_code_ = 1;
            return false;
        }
    }

    setup_logging();
    parse_options_ = ParseOptions::from_config(config_);
    build_options_ = BuildOptions::from_config(config_);

    LOG_DEBUG("%s v%s: command '%s' (%zu args)", AppInfo::NAME, AppInfo::VERSION,
              command_.c_str(), args_.size());
    return true;
}

int Application::run() {
    if (command_ == "parse") return cmd_parse(args_);
    if (command_ == "build") return cmd_build(args_);
    if (command_ == "import") return cmd_import(args_);

    LOG_ERROR("Unknown command '%s' (try --help)", command_.c_str());
    return 2;
}

void Application::shutdown() {
    LOG_DEBUG("Goodbye!");
}

bool Application::emit(const std::string& text, const std::string& out_path) {
    if (out_path.empty() || out_path == "-") {
        std::cout << text;
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::string error;
    if (!write_file(out_path, text, error)) {
        LOG_ERROR("%s", error.c_str());
        return false;
    }
    LOG_INFO("Wrote %s", out_path.c_str());
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_parse(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        LOG_ERROR("usage: parse <file.org|directory>");
        return 2;
    }
    const std::string& target = args[0];

    Json out;
    Json failures = Json::array();
    int rc = 0;

    if (is_directory(target)) {
        DirectoryParseReport report = parse_directory(target, parse_options_);
        if (!report.success) {
            return 1;
        }
        out["conversations"] = to_json(report.conversations);
        for (size_t i = 0; i < report.failures.size(); ++i) {
            Json f;
            f["path"] = report.failures[i].path;
            f["error"] = report.failures[i].error;
            failures.push_back(f);
        }
    } else {
        ParseResult result = parse_org_file(target, parse_options_);
        if (!result.success) {
            LOG_ERROR("Error parsing %s: %s", target.c_str(), result.error.c_str());
            Json f;
            f["path"] = target;
            f["error"] = result.error;
            failures.push_back(f);
            rc = 1;
        }
        out["conversations"] = to_json(result.conversations);
    }
    out["failures"] = failures;

    if (!emit(out.dump(2) + "\n", "")) return 1;
    return rc;
}

int Application::cmd_build(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        LOG_ERROR("usage: build <conversations.json> [out.org]");
        return 2;
    }

    std::string text;
    std::string error;
    if (!read_file(args[0], text, error)) {
        LOG_ERROR("%s", error.c_str());
        return 1;
    }

    Json doc = Json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        LOG_ERROR("%s: invalid JSON", args[0].c_str());
        return 1;
    }
    // Accept either the `parse` output or a bare array
    const Json& list = (doc.is_object() && doc.contains("conversations")) ? doc["conversations"] : doc;
    if (!list.is_array()) {
        LOG_ERROR("%s: expected an array of conversations", args[0].c_str());
        return 1;
    }

    std::vector<Conversation> conversations;
    for (size_t i = 0; i < list.size(); ++i) {
        Conversation conv;
        if (!from_json(list[i], conv, error)) {
            LOG_ERROR("%s: conversation %zu: %s", args[0].c_str(), i, error.c_str());
            return 1;
        }
        conversations.push_back(conv);
    }

    BuildResult built = build_org_document(conversations, build_options_);
    return emit(built.document, args.size() > 1 ? args[1] : "") ? 0 : 1;
}

int Application::cmd_import(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        LOG_ERROR("usage: import <history.csv> [out_dir]");
        return 2;
    }
    const std::string out_dir = args.size() > 1 ? args[1] : "output";

    std::string text;
    std::string error;
    if (!read_file(args[0], text, error)) {
        LOG_ERROR("%s", error.c_str());
        return 1;
    }

    HistoryImport imported = import_history_csv(text);
    if (!imported.success) {
        LOG_ERROR("%s: %s", args[0].c_str(), imported.error.c_str());
        return 1;
    }

    int rc = 0;
    for (size_t i = 0; i < imported.days.size(); ++i) {
        const HistoryDay& day = imported.days[i];
        BuildResult built = build_org_document(day.conversations, build_options_);
        std::string path = join_path(out_dir, day.date + ".org");
        if (!write_file(path, built.document, error)) {
            LOG_ERROR("%s", error.c_str());
            rc = 1;
            continue;
        }
        LOG_INFO("  %s: %zu conversation(s)", base_name(path).c_str(), day.conversations.size());
    }

    LOG_INFO("Converted %zu rows into %zu org files", imported.rows, imported.days.size());
    return rc;
}

} // namespace dailies
