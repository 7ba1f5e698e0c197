#include "Config.hpp"

#include "Logger.hpp"

namespace tw {

void Config::setConfigPath(const std::string& configPath) {
  _topNode = YAML::LoadFile(configPath);
  _configPath = configPath;
  SPDLOG_INFO("Loaded config file '{}'", configPath);
}

bool Config::hasClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    return false;
  }
  return _topNode["classes"][std::string(className)].IsDefined();
}

YAML::Node Config::getClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    throw std::runtime_error(std::format(
        "Config file '{}' is missing 'classes' section", _configPath));
  }

  YAML::Node classNode = _topNode["classes"][std::string(className)];
  if (!classNode || !classNode.IsDefined()) {
    throw std::runtime_error(std::format(
        "Failed to find entry for '{}' in the config file '{}'",
        className, _configPath));
  }
  if (!classNode.IsMap()) {
    throw std::runtime_error(std::format(
        "Entry for '{}' in the config file '{}' must be a map", className,
        _configPath));
  }

  return classNode;
}

}  // namespace tw
