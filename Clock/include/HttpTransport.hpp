#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "IHttpTransport.hpp"

struct HttpUrl {
  std::string host{};
  std::string port{"80"};
  std::string target{"/"};
};

// Accepts http://host[:port][/path][?query]; IPv6 literals in brackets.
HttpResult<HttpUrl> parseHttpUrl(std::string_view url);

HttpResult<HttpResponse> parseHttpResponse(std::string_view raw);

// Blocking HTTP/1.0 GET over a plain TCP socket. One connection per request.
class HttpTransport final : public IHttpTransport {
 public:
  struct Options {
    std::chrono::milliseconds timeout{5000};
    std::size_t maxResponseBytes{1024 * 1024};
  };

  HttpTransport();
  explicit HttpTransport(Options options);

  HttpResult<HttpResponse> get(std::string_view url) override;

 private:
  Options _options;
};
