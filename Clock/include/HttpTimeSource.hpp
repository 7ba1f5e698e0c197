#pragma once

#include <memory>

#include "HttpTransport.hpp"
#include "ITimeSource.hpp"

// Reads {"simulated_time": "<RFC3339>"} from an HTTP endpoint.
class HttpTimeSource final : public ITimeSource {
 public:
  HttpTimeSource();
  explicit HttpTimeSource(HttpTransport::Options options);
  explicit HttpTimeSource(IHttpTransport& transport);

  SimClockResult<tw::SysTime> fetchSimulatedTime(
      std::string_view address) override;

 private:
  std::unique_ptr<IHttpTransport> _ownedTransport;
  IHttpTransport* _transport{nullptr};
};
