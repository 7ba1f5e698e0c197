#include "HttpTransport.hpp"

#include <Logger.hpp>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <format>
#include <memory>
#include <utility>

namespace {
std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string errnoMessage(const std::string_view what) {
  return std::format("{}: {}", what, std::strerror(errno));
}

bool isValidPort(const std::string_view port) {
  int value = 0;
  const auto [ptr, ec] =
      std::from_chars(port.data(), port.data() + port.size(), value);
  return !port.empty() && ec == std::errc{} &&
         ptr == port.data() + port.size() && value > 0 && value <= 65535;
}

// Owns a socket descriptor. Non-copyable, movable.
class SocketHandle {
 public:
  SocketHandle() = default;
  explicit SocketHandle(const int fd) : _fd(fd) {}

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  SocketHandle(SocketHandle&& other) noexcept
      : _fd(std::exchange(other._fd, -1)) {}

  SocketHandle& operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
      cleanup();
      _fd = std::exchange(other._fd, -1);
    }
    return *this;
  }

  ~SocketHandle() { cleanup(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }
  explicit operator bool() const noexcept { return _fd >= 0; }

 private:
  void cleanup() noexcept {
    if (_fd >= 0) {
      ::close(_fd);
      _fd = -1;
    }
  }

  int _fd{-1};
};

HttpResult<void> applyTimeout(const int fd,
                              const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1 ||
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) {
    return std::unexpected(errnoMessage("setsockopt"));
  }
  return {};
}

HttpResult<SocketHandle> connectTo(const HttpUrl& url,
                                   const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* found = nullptr;
  if (const int rc =
          ::getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &found);
      rc != 0) {
    return std::unexpected(std::format("cannot resolve '{}': {}", url.host,
                                       ::gai_strerror(rc)));
  }
  const std::unique_ptr<addrinfo, void (*)(addrinfo*)> addresses(
      found, ::freeaddrinfo);

  std::string lastError = "no addresses";
  for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    SocketHandle candidate(
        ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!candidate) {
      lastError = errnoMessage("socket");
      continue;
    }
    if (auto applied = applyTimeout(candidate.fd(), timeout); !applied) {
      lastError = applied.error();
      continue;
    }
    if (::connect(candidate.fd(), ai->ai_addr, ai->ai_addrlen) == -1) {
      lastError = errnoMessage("connect");
      continue;
    }
    return candidate;
  }
  return std::unexpected(std::format("cannot connect to {}:{}: {}", url.host,
                                     url.port, lastError));
}

HttpResult<void> sendAll(const SocketHandle& socket, const std::string_view data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(socket.fd(), data.data() + sent, data.size() - sent,
                          MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(errnoMessage("send"));
    }
    sent += static_cast<std::size_t>(n);
  }
  return {};
}

// The timeout bounds the whole response, not each read.
HttpResult<std::string> receiveAll(const SocketHandle& socket,
                                   const std::size_t maxBytes,
                                   const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string raw;
  std::array<char, 4096> buffer{};
  while (true) {
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
      return std::unexpected(std::string("recv: timed out"));
    }
    pollfd pfd{socket.fd(), POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(errnoMessage("poll"));
    }
    if (ready == 0) {
      return std::unexpected(std::string("recv: timed out"));
    }
    const auto n = ::recv(socket.fd(), buffer.data(), buffer.size(), 0);
    if (n == 0) {
      return raw;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return std::unexpected(std::string("recv: timed out"));
      }
      return std::unexpected(errnoMessage("recv"));
    }
    raw.append(buffer.data(), static_cast<std::size_t>(n));
    if (raw.size() > maxBytes) {
      return std::unexpected(
          std::format("response exceeds {} bytes", maxBytes));
    }
  }
}
}  // namespace

HttpResult<HttpUrl> parseHttpUrl(const std::string_view url) {
  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string_view::npos) {
    return std::unexpected(std::format("'{}' is not an absolute URL", url));
  }
  const auto scheme = toLower(std::string(url.substr(0, schemeEnd)));
  if (scheme != "http") {
    return std::unexpected(
        std::format("Unsupported URL scheme '{}' in '{}'", scheme, url));
  }

  auto rest = url.substr(schemeEnd + 3);
  if (const auto fragment = rest.find('#'); fragment != std::string_view::npos) {
    rest = rest.substr(0, fragment);
  }
  const auto authorityEnd = rest.find_first_of("/?");
  const auto authority = rest.substr(0, authorityEnd);

  HttpUrl parsed;
  if (authorityEnd != std::string_view::npos) {
    parsed.target = std::string(rest.substr(authorityEnd));
    if (parsed.target.front() == '?') {
      parsed.target.insert(0, "/");
    }
  }
  if (authority.find('@') != std::string_view::npos) {
    return std::unexpected(
        std::format("Credentials in URL '{}' are not supported", url));
  }

  std::string_view portText;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected(std::format("Unterminated IPv6 host in '{}'", url));
    }
    parsed.host = std::string(authority.substr(1, close - 1));
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return std::unexpected(std::format("Malformed host in '{}'", url));
      }
      portText = tail.substr(1);
      if (portText.empty()) {
        return std::unexpected(std::format("Empty port in '{}'", url));
      }
    }
  } else {
    const auto colon = authority.rfind(':');
    parsed.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
      portText = authority.substr(colon + 1);
      if (portText.empty()) {
        return std::unexpected(std::format("Empty port in '{}'", url));
      }
    }
  }

  if (parsed.host.empty()) {
    return std::unexpected(std::format("Missing host in '{}'", url));
  }
  if (!portText.empty()) {
    if (!isValidPort(portText)) {
      return std::unexpected(
          std::format("Invalid port '{}' in '{}'", portText, url));
    }
    parsed.port = std::string(portText);
  }
  return parsed;
}

HttpResult<HttpResponse> parseHttpResponse(const std::string_view raw) {
  const auto lineEnd = raw.find("\r\n");
  if (lineEnd == std::string_view::npos || !raw.starts_with("HTTP/")) {
    return std::unexpected(std::string("Malformed HTTP status line"));
  }
  const auto statusLine = raw.substr(0, lineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos ||
      statusLine.size() < firstSpace + 4) {
    return std::unexpected(
        std::format("Malformed HTTP status line '{}'", statusLine));
  }
  const auto code = statusLine.substr(firstSpace + 1, 3);
  HttpResponse response;
  const auto [ptr, ec] =
      std::from_chars(code.data(), code.data() + code.size(), response.status);
  if (ec != std::errc{} || ptr != code.data() + code.size() ||
      response.status < 100 || response.status > 599) {
    return std::unexpected(
        std::format("Malformed HTTP status line '{}'", statusLine));
  }

  const auto headersEnd = raw.find("\r\n\r\n");
  if (headersEnd == std::string_view::npos) {
    return std::unexpected(std::string("Truncated HTTP headers"));
  }
  response.body = std::string(raw.substr(headersEnd + 4));
  return response;
}

HttpTransport::HttpTransport() : HttpTransport(Options{}) {}

HttpTransport::HttpTransport(Options options) : _options(options) {}

HttpResult<HttpResponse> HttpTransport::get(const std::string_view url) {
  const auto parsed = parseHttpUrl(url);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }

  const auto socket = connectTo(*parsed, _options.timeout);
  if (!socket) {
    return std::unexpected(socket.error());
  }

  const bool ipv6Literal = parsed->host.find(':') != std::string::npos;
  auto hostHeader = ipv6Literal ? "[" + parsed->host + "]" : parsed->host;
  if (parsed->port != "80") {
    hostHeader += ":" + parsed->port;
  }
  const auto request = std::format(
      "GET {} HTTP/1.0\r\n"
      "Host: {}\r\n"
      "Accept: application/json\r\n"
      "User-Agent: timewarp\r\n"
      "Connection: close\r\n"
      "\r\n",
      parsed->target, hostHeader);
  SPDLOG_DEBUG("GET {} from {}:{}", parsed->target, parsed->host, parsed->port);

  if (auto sent = sendAll(*socket, request); !sent) {
    return std::unexpected(sent.error());
  }
  const auto raw =
      receiveAll(*socket, _options.maxResponseBytes, _options.timeout);
  if (!raw) {
    return std::unexpected(raw.error());
  }

  auto response = parseHttpResponse(*raw);
  if (response) {
    SPDLOG_DEBUG("HTTP {} with {} byte body from {}", response->status,
                 response->body.size(), url);
  }
  return response;
}
