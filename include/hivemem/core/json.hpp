/*
 * HiveMem C++ - JSON type
 */
#ifndef hivemem_CORE_JSON_HPP
#define hivemem_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace hivemem {

typedef nlohmann::json Json;

} // namespace hivemem

#endif // hivemem_CORE_JSON_HPP
