/*
 * warden C++17 - Configuration
 *
 * JSON-backed configuration with dot-path lookups ("security.debounce_ms").
 */
#ifndef warden_CORE_CONFIG_HPP
#define warden_CORE_CONFIG_HPP

#include <warden/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace warden {

class Config {
public:
    Config();

    // Load a JSON file; returns false if it is missing or malformed
    bool load_file(const std::string& path);
    bool load_string(const std::string& content);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& raw() const { return root_; }
    const std::string& source_path() const { return source_path_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json root_;
    std::string source_path_;
};

} // namespace warden

#endif // warden_CORE_CONFIG_HPP
