#pragma once

#include <string>

namespace sw::types { struct ServiceRecord; }

namespace sw::host {

class Sandbox;

inline constexpr unsigned int LOG_ROLL_SIZE_THRESHOLD_KB = 10240;
inline constexpr unsigned int LOG_ROLL_KEEP_FILES = 8;

// XML consumed by the service-host tool. Every user-supplied value goes
// through the serializer so it cannot alter the document structure.
std::string renderHostConfig(const types::ServiceRecord& record, const Sandbox& sandbox);

}
