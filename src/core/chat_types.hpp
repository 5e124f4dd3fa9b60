#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inference_gateway {

// =============================================================================
// OpenAI-style chat completion payloads as the core sees them. The transport
// converts its wire messages into these before submission.
// =============================================================================

struct ChatMessage {
  std::string role;
  std::string content;
};

struct ChatCompletionRequest {
  std::string request_id;
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
  bool stream = false;
};

struct CompletionUsage {
  std::uint32_t prompt_tokens = 0;
  std::uint32_t completion_tokens = 0;
};

struct ChatCompletionResponse {
  std::string request_id;
  std::string model;
  std::string runner_id;
  ChatMessage message;
  std::string finish_reason;
  CompletionUsage usage;
};

}  // namespace inference_gateway
