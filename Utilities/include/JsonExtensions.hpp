#pragma once

#include <CommonDefinitions.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

namespace tw {

inline constexpr const char* kSimulatedTimeKey = "simulated_time";

template <typename TEnum>
std::string enumToString(const TEnum value) {
  static_assert(std::is_enum_v<TEnum>);
  return std::string(magic_enum::enum_name(value));
}

}  // namespace tw

namespace nlohmann {

template <>
struct adl_serializer<tw::SyncResponse> {
  static void to_json(json& j, const tw::SyncResponse& v) {
    j = json{{tw::kSimulatedTimeKey, v.simulatedTime}};
  }

  // Fields other than simulated_time are ignored.
  static void from_json(const json& j, tw::SyncResponse& v) {
    if (!j.is_object()) {
      throw std::runtime_error("Expected JSON object for sync response.");
    }
    if (!j.contains(tw::kSimulatedTimeKey) ||
        !j.at(tw::kSimulatedTimeKey).is_string()) {
      throw std::runtime_error(std::string("Missing or invalid '") +
                               tw::kSimulatedTimeKey + "' entry");
    }
    v.simulatedTime = j.at(tw::kSimulatedTimeKey).get<std::string>();
  }
};

}  // namespace nlohmann
