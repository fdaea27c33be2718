#include "device_scheduler.hpp"

namespace rnaflow::scheduler {

std::string DeviceFor(std::size_t member_index, const std::vector<std::string>& devices) {
  if (devices.empty()) {
    return kDefaultDevice;
  }
  return devices[member_index % devices.size()];
}

std::vector<std::string> Assign(std::size_t member_count, const std::vector<std::string>& devices) {
  std::vector<std::string> out;
  out.reserve(member_count);
  for (std::size_t i = 0; i < member_count; ++i) {
    out.push_back(DeviceFor(i, devices));
  }
  return out;
}

} // namespace rnaflow::scheduler
