#pragma once

#include <cstdint>
#include <string>

#include "service_context.hpp"
#include "streamctl/v1.hpp"

namespace streamctl::service {

inline constexpr const char*   kDefaultStreamId = "stream";
inline constexpr std::uint32_t kDefaultTailLines = 200;
inline constexpr std::uint32_t kMaxTailLines     = 10000;

class StreamService {
 public:
  explicit StreamService(ServiceContext ctx);

  streamctl::v1::StartStreamResponse     StartStream(const streamctl::v1::StartStreamRequest& req);
  streamctl::v1::StopStreamResponse      StopStream(const streamctl::v1::StopStreamRequest& req);
  streamctl::v1::GetStreamStatusResponse GetStreamStatus(const streamctl::v1::GetStreamStatusRequest& req);
  streamctl::v1::ListStreamsResponse     ListStreams(const streamctl::v1::ListStreamsRequest& req);
  streamctl::v1::TailLogResponse         TailLog(const streamctl::v1::TailLogRequest& req);
  streamctl::v1::CleanupResponse         Cleanup(const streamctl::v1::CleanupRequest& req);
  streamctl::v1::StopAllStreamsResponse  StopAllStreams(const streamctl::v1::StopAllStreamsRequest& req);
  streamctl::v1::SweepResponse           Sweep(const streamctl::v1::SweepRequest& req);

 private:
  ServiceContext ctx_;
};

// 0 means the default; anything above the cap is clamped.
std::uint32_t ClampTailLines(std::uint32_t requested);

} // namespace streamctl::service
