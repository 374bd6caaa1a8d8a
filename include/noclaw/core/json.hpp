/*
 * noclaw C++ - JSON type
 *
 * Every wire document (request file, primary response, sidecar, mount
 * declaration, config) goes through nlohmann::json under this alias.
 */
#ifndef noclaw_CORE_JSON_HPP
#define noclaw_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace noclaw {

typedef nlohmann::json Json;

} // namespace noclaw

#endif // noclaw_CORE_JSON_HPP
