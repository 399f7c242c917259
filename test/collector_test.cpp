#include <gtest/gtest.h>
#include <codebox/collector.h>

using nlohmann::json;

TEST(CollectorTest, SuccessEnvelope) {
  ExecutionOutcome res = outcome::Success{json{{"a", 1}}, CapturedOutput("hi\n", false), CapturedOutput()};
  EXPECT_EQ(OutcomeStatus(res), Status::OK);
  EXPECT_FALSE(OutcomeErrorKind(res));
  EXPECT_FALSE(OutcomeLimit(res));

  ResponseEnvelope env = Collect(res);
  env.request_id = "abc";
  json j = env.ToJson();
  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["value"], (json{{"a", 1}}));
  EXPECT_EQ(j["stdout"], "hi\n");
  EXPECT_EQ(j["stderr"], "");
  EXPECT_EQ(j["stdout_truncated"], false);
  EXPECT_TRUE(j["error"].is_null());
  EXPECT_EQ(j["request_id"], "abc");
}

TEST(CollectorTest, NullValueIsPresent) {
  json j = Collect(outcome::Success{json(), {}, {}}).ToJson();
  ASSERT_TRUE(j.contains("value"));
  EXPECT_TRUE(j["value"].is_null());
}

TEST(CollectorTest, RuntimeErrorEnvelope) {
  ExecutionOutcome res = outcome::RuntimeError{ErrorKind::RUNTIME_ERROR, "bad", "ValueError",
      "Traceback (most recent call last):\n", CapturedOutput(), CapturedOutput("warn", false)};
  EXPECT_EQ(OutcomeStatus(res), Status::ERROR);
  EXPECT_EQ(OutcomeErrorKind(res), ErrorKind::RUNTIME_ERROR);

  json j = Collect(res).ToJson();
  EXPECT_EQ(j["status"], "error");
  EXPECT_TRUE(j["value"].is_null());
  EXPECT_EQ(j["stderr"], "warn");
  EXPECT_EQ(j["error"]["kind"], "RuntimeError");
  EXPECT_EQ(j["error"]["message"], "bad");
  EXPECT_EQ(j["error"]["exception"], "ValueError");
  EXPECT_EQ(j["error"]["traceback"], "Traceback (most recent call last):\n");
}

TEST(CollectorTest, EmptyDetailsAreOmitted) {
  json j = Collect(outcome::RuntimeError{ErrorKind::PERMISSION_DENIED, "os.system", "", "", {}, {}}).ToJson();
  EXPECT_EQ(j["error"]["kind"], "PermissionDenied");
  EXPECT_FALSE(j["error"].contains("exception"));
  EXPECT_FALSE(j["error"].contains("traceback"));
}

TEST(CollectorTest, LimitOutcomes) {
  ExecutionOutcome wall = outcome::TimedOut{LimitKind::TIME, {}, {}};
  ExecutionOutcome cpu = outcome::TimedOut{LimitKind::CPU, {}, {}};
  ExecutionOutcome mem = outcome::ResourceExceeded{LimitKind::MEMORY, {}, {}};
  ExecutionOutcome out = outcome::ResourceExceeded{LimitKind::OUTPUT, CapturedOutput("xxx", true), {}};
  ExecutionOutcome busy = outcome::ResourceExceeded{LimitKind::CONCURRENCY, {}, {}};

  EXPECT_EQ(OutcomeStatus(wall), Status::TIMEOUT);
  EXPECT_EQ(OutcomeStatus(cpu), Status::TIMEOUT);
  EXPECT_EQ(OutcomeStatus(mem), Status::RESOURCE_EXCEEDED);
  EXPECT_EQ(OutcomeErrorKind(wall), ErrorKind::TIMED_OUT);
  EXPECT_EQ(OutcomeErrorKind(cpu), ErrorKind::TIMED_OUT);
  EXPECT_EQ(OutcomeErrorKind(mem), ErrorKind::MEMORY_EXCEEDED);
  EXPECT_EQ(OutcomeErrorKind(out), ErrorKind::OUTPUT_EXCEEDED);
  EXPECT_EQ(OutcomeErrorKind(busy), ErrorKind::CONCURRENCY_EXCEEDED);
  EXPECT_EQ(OutcomeLimit(cpu), LimitKind::CPU);
  EXPECT_EQ(OutcomeLimit(busy), LimitKind::CONCURRENCY);

  json j = Collect(wall).ToJson();
  EXPECT_EQ(j["status"], "timeout");
  EXPECT_EQ(j["error"]["kind"], "TimedOut");
  EXPECT_EQ(j["error"]["message"], "time limit exceeded");

  j = Collect(out).ToJson();
  EXPECT_EQ(j["status"], "resource_exceeded");
  EXPECT_EQ(j["error"]["kind"], "OutputExceeded");
  EXPECT_EQ(j["stdout"], "xxx");
  EXPECT_EQ(j["stdout_truncated"], true);
}

TEST(CollectorTest, KilledEnvelope) {
  ExecutionOutcome res = outcome::Killed{"cancelled", {}, {}};
  EXPECT_EQ(OutcomeStatus(res), Status::KILLED);
  json j = Collect(res).ToJson();
  EXPECT_EQ(j["status"], "killed");
  EXPECT_EQ(j["error"]["kind"], "Killed");
  EXPECT_EQ(j["error"]["message"], "cancelled");
}

TEST(CollectorTest, RequestLevelEnvelopes) {
  json j = InvalidRequestEnvelope("missing field: code").ToJson();
  EXPECT_EQ(j["status"], "error");
  EXPECT_EQ(j["error"]["kind"], "InvalidRequest");
  EXPECT_EQ(j["error"]["message"], "missing field: code");
  EXPECT_EQ(j["stdout"], "");

  j = InternalErrorEnvelope("cannot mount scratch directory").ToJson();
  EXPECT_EQ(j["status"], "internal_error");
  EXPECT_EQ(j["error"]["kind"], "InternalError");
}

TEST(CollectorTest, InvalidUtf8IsReplaced) {
  ResponseEnvelope env = Collect(outcome::Success{json(), CapturedOutput("a\xff" "b", false), {}});
  std::string dumped = env.ToJson().dump(-1, ' ', false, json::error_handler_t::replace);
  EXPECT_NE(dumped.find("a\xef\xbf\xbd" "b"), std::string::npos);
}
