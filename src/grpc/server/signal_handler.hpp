#pragma once

#include <grpcpp/server.h>

#include <atomic>
#include <chrono>
#include <memory>

namespace inference_gateway {

struct ServerContext {
  std::unique_ptr<grpc::Server> server;
  std::atomic<bool> stop_requested{false};
};

auto server_context() -> ServerContext&;

// Only stores the stop flag; everything else happens on the main thread.
void signal_handler(int signal);
void install_signal_handlers();

/// Blocks the caller until a signal (or a test) requests the stop.
void wait_for_stop_request(
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));

}  // namespace inference_gateway
