#include <format>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include "core/batch_dispatcher.hpp"
#include "core/batch_queue.hpp"
#include "core/router.hpp"
#include "core/runner_registry.hpp"
#include "gateway_service.hpp"
#include "grpc/runner/grpc_runner_executor.hpp"
#include "monitoring/metrics.hpp"
#include "signal_handler.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace inference_gateway {

auto
handle_program_arguments(std::span<char const* const> args) -> RuntimeConfig
{
  const char* config_path = nullptr;

  auto remaining = args.subspan(1);
  auto require_value = [&](std::string_view flag) {
    if (remaining.empty() || remaining.front() == nullptr) {
      log_fatal(std::format("Missing value for {} argument.\n", flag));
    }
    const char* value = remaining.front();
    remaining = remaining.subspan(1);
    return value;
  };

  while (!remaining.empty()) {
    const char* raw_arg = remaining.front();
    remaining = remaining.subspan(1);

    if (raw_arg == nullptr) {
      log_fatal("Unexpected null program argument.\n");
    }

    std::string_view arg{raw_arg};
    if (arg == "--config" || arg == "-c") {
      config_path = require_value(arg);
      continue;
    }
    log_fatal(std::format(
        "Unknown argument '{}'. Only --config/-c is supported; all other "
        "settings must live in the YAML file.\n",
        arg));
  }

  if (config_path == nullptr) {
    log_fatal("Missing required --config argument.\n");
  }

  RuntimeConfig cfg = load_config(config_path);
  cfg.config_path = config_path;

  if (!cfg.valid) {
    log_fatal("Invalid configuration file.\n");
  }

  log_info(cfg.verbosity, std::format("__cplusplus = {}", __cplusplus));
  log_info(
      cfg.verbosity,
      std::format("Address         : {}", cfg.server_address));
  log_info(
      cfg.verbosity,
      std::format(
          "Batching        : {} (min {} / timeout {} ms / tick {} ms)",
          cfg.batching.enabled ? "on" : "off",
          cfg.batching.queue.min_batch_size,
          cfg.batching.queue.batch_timeout.count(),
          cfg.batching.dispatch_tick.count()));
  log_info(
      cfg.verbosity,
      std::format(
          "Runners         : heartbeat timeout {} ms, sweep every {} ms",
          cfg.runners.heartbeat_timeout.count(),
          cfg.runners.liveness_sweep.count()));

  return cfg;
}

void
run_gateway(const RuntimeConfig& opts)
{
  RunnerRegistry registry(opts.runners.heartbeat_timeout, opts.verbosity);
  registry.start_liveness_sweep(opts.runners.liveness_sweep);

  BatchQueue queue(opts.batching.queue);

  GrpcRunnerExecutor executor(GrpcRunnerExecutorOptions{
      opts.runners.execution_timeout, opts.max_message_bytes,
      opts.verbosity});
  executor.start();

  BatchDispatcher dispatcher(
      queue, registry, executor,
      DispatcherSettings{
          opts.batching.dispatch_tick, opts.batching.no_runner_timeout},
      opts.verbosity);
  dispatcher.start();

  Router router(
      registry, queue, dispatcher,
      RouterSettings{opts.batching.enabled, opts.model_classes},
      opts.verbosity);
  GatewayServiceImpl service(
      router, registry, opts.runners.heartbeat_timeout, opts.verbosity);

  auto& server_ctx = server_context();
  std::jthread grpc_thread([&]() {
    const auto server_options = GrpcServerOptions{
        opts.server_address, opts.max_message_bytes, opts.verbosity};
    RunGrpcServer(service, server_options, server_ctx.server);
  });

  install_signal_handlers();
  wait_for_stop_request();
  log_info(opts.verbosity, "Stop requested, shutting down");

  // Resolve every pending call while the server can still answer it.
  router.shutdown();
  dispatcher.stop();
  StopServer(server_ctx.server.get());
  grpc_thread.join();
  executor.shutdown();
  registry.stop_liveness_sweep();
}

}  // namespace inference_gateway

auto
main(int argc, char* argv[]) -> int
{
  try {
    inference_gateway::RuntimeConfig opts =
        inference_gateway::handle_program_arguments(
            {argv, static_cast<size_t>(argc)});
    const bool metrics_ok = inference_gateway::init_metrics(opts.metrics_port);
    if (!metrics_ok) {
      inference_gateway::log_warning(
          "Metrics server failed to start; continuing without metrics.");
    }
    inference_gateway::run_gateway(opts);
    inference_gateway::shutdown_metrics();
  }
  catch (const inference_gateway::GatewayException& e) {
    std::cerr << "\o{33}[1;31m[Gateway Error] " << e.what() << "\o{33}[0m\n";
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "\o{33}[1;31m[General Error] " << e.what() << "\o{33}[0m\n";
    return -1;
  }

  return 0;
}
