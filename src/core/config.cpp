#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

namespace warden {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        LOG_DEBUG("[Config] Cannot read %s", path.c_str());
        return false;
    }
    if (!load_string(content)) {
        LOG_ERROR("[Config] Malformed JSON in %s", path.c_str());
        return false;
    }
    source_path_ = path;
    return true;
}

bool Config::load_string(const std::string& content) {
    Json parsed = Json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    root_ = std::move(parsed);
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return def;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return def;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* v = find(key);
    if (!v) return out;
    if (v->is_string()) {
        out.push_back(v->get<std::string>());
        return out;
    }
    if (!v->is_array()) return out;
    for (const auto& item : *v) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace warden
