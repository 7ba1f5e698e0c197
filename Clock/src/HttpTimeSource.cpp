#include "HttpTimeSource.hpp"

#include <JsonExtensions.hpp>

#include <format>
#include <stdexcept>

#include <nlohmann/json.hpp>

using tw::ESimClockError;

HttpTimeSource::HttpTimeSource() : HttpTimeSource(HttpTransport::Options{}) {}

HttpTimeSource::HttpTimeSource(HttpTransport::Options options)
    : _ownedTransport(std::make_unique<HttpTransport>(options)),
      _transport(_ownedTransport.get()) {}

HttpTimeSource::HttpTimeSource(IHttpTransport& transport)
    : _transport(&transport) {}

SimClockResult<tw::SysTime> HttpTimeSource::fetchSimulatedTime(
    const std::string_view address) {
  const auto response = _transport->get(address);
  if (!response) {
    return std::unexpected(SimClockError{
        ESimClockError::FetchError,
        std::format("GET '{}' failed: {}", address, response.error())});
  }
  if (response->status < 200 || response->status > 299) {
    return std::unexpected(SimClockError{
        ESimClockError::FetchError,
        std::format("GET '{}' returned HTTP {}", address, response->status)});
  }

  tw::SyncResponse payload;
  try {
    payload = nlohmann::json::parse(response->body).get<tw::SyncResponse>();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(SimClockError{
        ESimClockError::TimeFormatError,
        std::format("Response from '{}' is not valid JSON: {}", address,
                    e.what())});
  } catch (const std::runtime_error& e) {
    return std::unexpected(SimClockError{
        ESimClockError::TimeFormatError,
        std::format("Unexpected response from '{}': {}", address, e.what())});
  }

  auto simulated = tw::parseRfc3339(payload.simulatedTime);
  if (!simulated) {
    return std::unexpected(
        SimClockError{ESimClockError::ParseError, simulated.error()});
  }
  return *simulated;
}
