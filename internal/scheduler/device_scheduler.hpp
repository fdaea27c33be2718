#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rnaflow::scheduler {

inline constexpr const char* kDefaultDevice = "default";

// Round-robin: member i gets devices[i % devices.size()]; an empty device
// list maps every member to kDefaultDevice (host/CPU fallback).
std::string DeviceFor(std::size_t member_index, const std::vector<std::string>& devices);

std::vector<std::string> Assign(std::size_t member_count, const std::vector<std::string>& devices);

} // namespace rnaflow::scheduler
