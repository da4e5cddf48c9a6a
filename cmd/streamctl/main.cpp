#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "streamctl/v1/stream_supervisor_service.grpc.pb.h"
#include "streamctl/v1.hpp"

using namespace streamctl::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  streamctl <addr> start <id> <source> <destination> [--overlay <image>] [--overlay-mode full|input] [-- <extra args>...]\n"
            << "  streamctl <addr> stop <id> [--force]\n"
            << "  streamctl <addr> status <id>\n"
            << "  streamctl <addr> list\n"
            << "  streamctl <addr> logs <id> [lines]\n"
            << "  streamctl <addr> cleanup [--kill-all] [--remove-logs] [id...]\n"
            << "  streamctl <addr> stop-all\n"
            << "  streamctl <addr> sweep\n";
}

static int Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = StreamSupervisorService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    StartStreamRequest req;
    auto*              spec = req.mutable_spec();
    spec->set_id(argv[3]);
    spec->set_source(argv[4]);
    spec->set_destination(argv[5]);

    for (int i = 6; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--overlay" && i + 1 < argc) {
        spec->set_overlay_image(argv[++i]);
      } else if (arg == "--overlay-mode" && i + 1 < argc) {
        const std::string mode = argv[++i];
        if (mode == "full") {
          spec->set_overlay_mode(OVERLAY_MODE_FULL);
        } else if (mode == "input") {
          spec->set_overlay_mode(OVERLAY_MODE_INPUT_ONLY);
        } else {
          std::cerr << "unsupported overlay mode: " << mode << "\n";
          return 1;
        }
      } else if (arg == "--") {
        for (++i; i < argc; ++i) {
          spec->add_extra_args(argv[i]);
        }
      } else {
        std::cerr << "unexpected argument: " << arg << "\n";
        return 1;
      }
    }

    StartStreamResponse resp;
    auto                status = stub->StartStream(&ctx, req, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    StopStreamRequest req;
    req.set_id(argv[3]);
    req.set_force(argc >= 5 && std::string(argv[4]) == "--force");

    StopStreamResponse resp;
    auto               status = stub->StopStream(&ctx, req, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetStreamStatusRequest req;
    req.set_id(argv[3]);

    GetStreamStatusResponse resp;
    auto                    status = stub->GetStreamStatus(&ctx, req, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListStreamsResponse resp;
    auto                status = stub->ListStreams(&ctx, ListStreamsRequest{}, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    TailLogRequest req;
    req.set_id(argv[3]);
    if (argc >= 5) {
      try {
        req.set_lines(static_cast<uint32_t>(std::stoul(argv[4])));
      } catch (const std::exception&) {
        std::cerr << "invalid line count: " << argv[4] << "\n";
        return 1;
      }
    }

    TailLogResponse resp;
    auto            status = stub->TailLog(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }
    std::cout << resp.content() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    CleanupRequest req;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--kill-all") {
        req.set_kill_all_managed(true);
      } else if (arg == "--remove-logs") {
        req.set_remove_logs(true);
      } else {
        req.add_ids(arg);
      }
    }

    CleanupResponse resp;
    auto            status = stub->Cleanup(&ctx, req, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "stop-all") {
    StopAllStreamsResponse resp;
    auto                   status = stub->StopAllStreams(&ctx, StopAllStreamsRequest{}, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    SweepResponse resp;
    auto          status = stub->Sweep(&ctx, SweepRequest{}, &resp);
    return status.ok() ? Print(resp) : Fail(status);
  }

  Usage();
  return 1;
}
