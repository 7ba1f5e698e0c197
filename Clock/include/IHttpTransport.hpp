#pragma once

#include <expected>
#include <string>
#include <string_view>

struct HttpResponse {
  int status{0};
  std::string body{};
};

template <typename T>
using HttpResult = std::expected<T, std::string>;

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResult<HttpResponse> get(std::string_view url) = 0;
};
