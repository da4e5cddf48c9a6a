#include "stream_server.hpp"

#include "grpc_error.hpp"
#include "streamctl/v1.hpp"

namespace streamctl::grpc {

StreamServer::StreamServer(std::shared_ptr<streamctl::service::StreamService> svc)
    : service_(std::move(svc)) {}

::grpc::Status StreamServer::StartStream(::grpc::ServerContext*,
                                         const streamctl::v1::StartStreamRequest* req,
                                         streamctl::v1::StartStreamResponse* resp) {
  try {
    *resp = service_->StartStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::StopStream(::grpc::ServerContext*,
                                        const streamctl::v1::StopStreamRequest* req,
                                        streamctl::v1::StopStreamResponse* resp) {
  try {
    *resp = service_->StopStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::GetStreamStatus(::grpc::ServerContext*,
                                             const streamctl::v1::GetStreamStatusRequest* req,
                                             streamctl::v1::GetStreamStatusResponse* resp) {
  try {
    *resp = service_->GetStreamStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::ListStreams(::grpc::ServerContext*,
                                         const streamctl::v1::ListStreamsRequest* req,
                                         streamctl::v1::ListStreamsResponse* resp) {
  try {
    *resp = service_->ListStreams(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::TailLog(::grpc::ServerContext*,
                                     const streamctl::v1::TailLogRequest* req,
                                     streamctl::v1::TailLogResponse* resp) {
  try {
    *resp = service_->TailLog(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::Cleanup(::grpc::ServerContext*,
                                     const streamctl::v1::CleanupRequest* req,
                                     streamctl::v1::CleanupResponse* resp) {
  try {
    *resp = service_->Cleanup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::StopAllStreams(::grpc::ServerContext*,
                                            const streamctl::v1::StopAllStreamsRequest* req,
                                            streamctl::v1::StopAllStreamsResponse* resp) {
  try {
    *resp = service_->StopAllStreams(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StreamServer::Sweep(::grpc::ServerContext*,
                                   const streamctl::v1::SweepRequest* req,
                                   streamctl::v1::SweepResponse* resp) {
  try {
    *resp = service_->Sweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamctl::grpc
