/*
 * warden C++17 - JSON
 *
 * Project-wide alias for nlohmann::json.
 */
#ifndef warden_CORE_JSON_HPP
#define warden_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace warden {

using Json = nlohmann::json;

// Serialize without throwing on invalid UTF-8 in string values
inline std::string dump_json(const Json& j, int indent = -1) {
    return j.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace warden

#endif // warden_CORE_JSON_HPP
