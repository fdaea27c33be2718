#pragma once

#include <string>

namespace rnaflow::util {

// Random RFC4122 version 4 UUID in canonical text form, used as the run id.
std::string NewRunId();

} // namespace rnaflow::util
