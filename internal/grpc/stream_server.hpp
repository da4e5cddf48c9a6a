#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/stream_service.hpp"
#include "streamctl/v1/stream_supervisor_service.grpc.pb.h"
#include "streamctl/v1.hpp"

namespace streamctl::grpc {

class StreamServer final : public streamctl::v1::StreamSupervisorService::Service {
public:
  explicit StreamServer(std::shared_ptr<streamctl::service::StreamService> svc);

  ::grpc::Status StartStream(::grpc::ServerContext*,
                             const streamctl::v1::StartStreamRequest*,
                             streamctl::v1::StartStreamResponse*) override;

  ::grpc::Status StopStream(::grpc::ServerContext*,
                            const streamctl::v1::StopStreamRequest*,
                            streamctl::v1::StopStreamResponse*) override;

  ::grpc::Status GetStreamStatus(::grpc::ServerContext*,
                                 const streamctl::v1::GetStreamStatusRequest*,
                                 streamctl::v1::GetStreamStatusResponse*) override;

  ::grpc::Status ListStreams(::grpc::ServerContext*,
                             const streamctl::v1::ListStreamsRequest*,
                             streamctl::v1::ListStreamsResponse*) override;

  ::grpc::Status TailLog(::grpc::ServerContext*,
                         const streamctl::v1::TailLogRequest*,
                         streamctl::v1::TailLogResponse*) override;

  ::grpc::Status Cleanup(::grpc::ServerContext*,
                         const streamctl::v1::CleanupRequest*,
                         streamctl::v1::CleanupResponse*) override;

  ::grpc::Status StopAllStreams(::grpc::ServerContext*,
                                const streamctl::v1::StopAllStreamsRequest*,
                                streamctl::v1::StopAllStreamsResponse*) override;

  ::grpc::Status Sweep(::grpc::ServerContext*,
                       const streamctl::v1::SweepRequest*,
                       streamctl::v1::SweepResponse*) override;

private:
  std::shared_ptr<streamctl::service::StreamService> service_;
};

} // namespace streamctl::grpc
