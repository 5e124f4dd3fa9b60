#include <gtest/gtest.h>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

#include "utils/exceptions.hpp"

using namespace inference_gateway;

namespace {

struct FailureCase {
  std::shared_ptr<RequestFailedException> error;
  GatewayErrorKind kind;
  const char* name;
  bool retryable;
};

class RequestFailures : public ::testing::TestWithParam<FailureCase> {};

}  // namespace

TEST_P(RequestFailures, CarryKindAndMessage)
{
  const auto& param = GetParam();
  EXPECT_EQ(param.error->kind(), param.kind);
  EXPECT_EQ(to_string(param.error->kind()), param.name);
  EXPECT_EQ(param.error->retryable(), param.retryable);
  EXPECT_STREQ(param.error->what(), "detail");
}

INSTANTIATE_TEST_SUITE_P(
    Exceptions, RequestFailures,
    ::testing::Values(
        FailureCase{
            std::make_shared<ModelUnavailableException>("detail"),
            GatewayErrorKind::ModelUnavailable, "model_unavailable", false},
        FailureCase{
            std::make_shared<RunnerLostException>("detail"),
            GatewayErrorKind::RunnerLost, "runner_lost", true},
        FailureCase{
            std::make_shared<ExecutionFailedException>("detail"),
            GatewayErrorKind::ExecutionFailed, "execution_failed", false},
        FailureCase{
            std::make_shared<QueueTimeoutException>("detail"),
            GatewayErrorKind::QueueTimeout, "queue_timeout", false},
        FailureCase{
            std::make_shared<CancelledException>("detail"),
            GatewayErrorKind::Cancelled, "cancelled", false}));

TEST(Exceptions, RequestFailuresAreGatewayExceptions)
{
  try {
    throw QueueTimeoutException("late");
  }
  catch (const GatewayException& e) {
    EXPECT_STREQ(e.what(), "late");
  }
}

TEST(Exceptions, RegistryFailuresAreNotRequestFailures)
{
  const DuplicateRunnerException duplicate("dup");
  const InvalidRunnerRegistrationException invalid("bad");
  const std::exception& dup_base = duplicate;
  const std::exception& invalid_base = invalid;
  EXPECT_NE(dynamic_cast<const GatewayException*>(&dup_base), nullptr);
  EXPECT_EQ(dynamic_cast<const RequestFailedException*>(&dup_base), nullptr);
  EXPECT_NE(dynamic_cast<const GatewayException*>(&invalid_base), nullptr);
  EXPECT_EQ(
      dynamic_cast<const RequestFailedException*>(&invalid_base), nullptr);
}
