#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace inference_gateway {

enum class GatewayErrorKind : std::uint8_t {
  ModelUnavailable,
  RunnerLost,
  ExecutionFailed,
  QueueTimeout,
  Cancelled
};

inline auto
to_string(GatewayErrorKind kind) -> std::string_view
{
  using enum GatewayErrorKind;
  switch (kind) {
    case ModelUnavailable:
      return "model_unavailable";
    case RunnerLost:
      return "runner_lost";
    case ExecutionFailed:
      return "execution_failed";
    case QueueTimeout:
      return "queue_timeout";
    case Cancelled:
      return "cancelled";
  }
  return "unknown";
}

// =============================================================================
// Base class for all gateway exceptions
// =============================================================================

class GatewayException : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// =============================================================================
// Request resolution failures. Every one of these ends up in exactly one
// caller's result sink.
// =============================================================================

class RequestFailedException : public GatewayException {
 public:
  RequestFailedException(GatewayErrorKind kind, const std::string& message)
      : GatewayException(message), kind_(kind)
  {
  }

  [[nodiscard]] auto kind() const noexcept -> GatewayErrorKind
  {
    return kind_;
  }

  /// Only a lost runner is worth retrying; the core itself never retries.
  [[nodiscard]] auto retryable() const noexcept -> bool
  {
    return kind_ == GatewayErrorKind::RunnerLost;
  }

 private:
  GatewayErrorKind kind_;
};

/// Thrown when no live runner serves the requested model
class ModelUnavailableException : public RequestFailedException {
 public:
  explicit ModelUnavailableException(const std::string& message)
      : RequestFailedException(GatewayErrorKind::ModelUnavailable, message)
  {
  }
};

/// Thrown when the assigned runner disconnected mid-execution
class RunnerLostException : public RequestFailedException {
 public:
  explicit RunnerLostException(const std::string& message)
      : RequestFailedException(GatewayErrorKind::RunnerLost, message)
  {
  }
};

/// Thrown when the runner reported an engine-level error
class ExecutionFailedException : public RequestFailedException {
 public:
  explicit ExecutionFailedException(const std::string& message)
      : RequestFailedException(GatewayErrorKind::ExecutionFailed, message)
  {
  }
};

/// Thrown when a request outlived the no-runner timeout in its queue
class QueueTimeoutException : public RequestFailedException {
 public:
  explicit QueueTimeoutException(const std::string& message)
      : RequestFailedException(GatewayErrorKind::QueueTimeout, message)
  {
  }
};

/// Thrown when the caller withdrew the request before resolution
class CancelledException : public RequestFailedException {
 public:
  explicit CancelledException(const std::string& message)
      : RequestFailedException(GatewayErrorKind::Cancelled, message)
  {
  }
};

// =============================================================================
// Runner registry failures
// =============================================================================

/// Thrown when a runner id is registered twice
class DuplicateRunnerException : public GatewayException {
 public:
  using GatewayException::GatewayException;
};

/// Thrown when a registration advertises no model or a zero batch size
class InvalidRunnerRegistrationException : public GatewayException {
 public:
  using GatewayException::GatewayException;
};

}  // namespace inference_gateway
