#include "signal_handler.hpp"

#include <csignal>
#include <thread>

namespace inference_gateway {

auto
server_context() -> ServerContext&
{
  static ServerContext ctx;
  return ctx;
}

void
signal_handler(int /*signal*/)
{
  server_context().stop_requested.store(true);
}

void
install_signal_handlers()
{
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

void
wait_for_stop_request(std::chrono::milliseconds poll_interval)
{
  auto& ctx = server_context();
  while (!ctx.stop_requested.load(std::memory_order_relaxed)) {
    std::this_thread::sleep_for(poll_interval);
  }
}

}  // namespace inference_gateway
