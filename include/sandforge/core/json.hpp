/*
 * sandforge - JSON type
 *
 * All JSON handling (config files, container engine and managed service
 * payloads) goes through nlohmann::json under the project-wide name Json.
 */
#ifndef sandforge_CORE_JSON_HPP
#define sandforge_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sandforge {

typedef nlohmann::json Json;

} // namespace sandforge

#endif // sandforge_CORE_JSON_HPP
