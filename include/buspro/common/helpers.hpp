#pragma once

#include <vector>
#include <string>
#include <optional>
#include "response.hpp"

namespace buspro {

std::string bytesToHex(const std::vector<uint8_t>& data);
std::string to_string(const DeviceKey& key);
std::string to_string(const Telegram& telegram);
const char* category_to_string(DeviceCategory category);
std::optional<DeviceCategory> category_from_string(const std::string& name);

} // namespace buspro
