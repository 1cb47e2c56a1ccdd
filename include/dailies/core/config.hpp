/*
 * dailies C++17 - Configuration
 *
 * JSON configuration file with dotted-key access:
 *   config.get_int("builder.max_iterations", 10)
 * reads {"builder": {"max_iterations": 10}}.
 */
#ifndef dailies_CORE_CONFIG_HPP
#define dailies_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace dailies {

typedef nlohmann::json Json;

class Config {
public:
    Config();

    // Load a JSON object from disk. On failure the previous contents are kept
    // and last_error() describes the problem.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& raw() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;

    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace dailies

#endif // dailies_CORE_CONFIG_HPP
