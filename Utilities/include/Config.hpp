#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Singleton.hpp"
#include "yaml-cpp/yaml.h"

namespace tw {
// Process-wide YAML configuration. Entries live under
// `classes.<ClassName>.<key>`.
class Config : public Singleton<Config> {
 public:
  void setConfigPath(const std::string& configPath);
  [[nodiscard]] const std::string& configPath() const { return _configPath; }

  [[nodiscard]] bool hasClassConfig(std::string_view className) const;
  YAML::Node getClassConfig(std::string_view className) const;

  template <typename T>
  T getRequired(std::string_view className, std::string_view key) const {
    const YAML::Node valueNode = lookup(className, key);
    if (!valueNode) {
      throw std::runtime_error(
          std::format("Missing required key '{}.{}' in config file '{}'",
                      className, key, _configPath));
    }
    return readAs<T>(valueNode, className, key, "");
  }

  template <typename T>
  T getOptional(std::string_view className, std::string_view key,
                T defaultValue) const {
    const YAML::Node valueNode = lookup(className, key);
    if (!valueNode) {
      return defaultValue;
    }
    return readAs<T>(valueNode, className, key, "optional ");
  }

 private:
  Config() = default;
  ~Config() = default;

  YAML::Node lookup(std::string_view className, std::string_view key) const {
    YAML::Node valueNode = getClassConfig(className)[std::string(key)];
    if (!valueNode.IsDefined() || valueNode.IsNull()) {
      return YAML::Node(YAML::NodeType::Undefined);
    }
    return valueNode;
  }

  template <typename T>
  T readAs(const YAML::Node& valueNode, std::string_view className,
            std::string_view key, std::string_view kind) const {
    try {
      return valueNode.as<T>();
    } catch (const YAML::Exception& e) {
      throw std::runtime_error(
          std::format("Invalid type for {}'{}.{}' in config file '{}': {}",
                      kind, className, key, _configPath, e.what()));
    }
  }

  std::string _configPath{};
  YAML::Node _topNode;
  friend class Singleton;
};
}  // namespace tw
