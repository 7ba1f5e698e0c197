#pragma once

#include <CommonDefinitions.hpp>

#include <expected>
#include <string>

struct SimClockError {
  tw::ESimClockError code{};
  std::string message{};
};

template <typename T>
using SimClockResult = std::expected<T, SimClockError>;
