/*
 * dailies C++17 - Application
 *
 * Command-line driver around the org converter:
 *   dailies-org [--config file.json] parse  <file.org|directory>
 *   dailies-org [--config file.json] build  <conversations.json> [out.org]
 *   dailies-org [--config file.json] import <history.csv> [out_dir]
 */
#ifndef dailies_CORE_APPLICATION_HPP
#define dailies_CORE_APPLICATION_HPP

#include <dailies/core/config.hpp>
#include <dailies/org/builder.hpp>
#include <dailies/org/document_parser.hpp>
#include <string>
#include <vector>

namespace dailies {

struct AppInfo {
    static const char* const NAME;
    static const char* const VERSION;
};

class Application {
public:
    static Application& instance();

    // Parses arguments and loads configuration. Returns false when there is
    // nothing to run (help/version) or on a usage error; exit_code() tells
    // which. Calling it again replaces the previous command line.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();

    int cmd_parse(const std::vector<std::string>& args);
    int cmd_build(const std::vector<std::string>& args);
    int cmd_import(const std::vector<std::string>& args);

    bool emit(const std::string& text, const std::string& out_path);

    Config config_;
    std::string config_file_;
    std::string command_;
    std::vector<std::string> args_;
    ParseOptions parse_options_;
    BuildOptions build_options_;
    int exit_code_;
};

} // namespace dailies

#endif // dailies_CORE_APPLICATION_HPP
