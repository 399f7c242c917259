#include <gtest/gtest.h>
#include <codebox/request.h>

using nlohmann::json;

namespace {

bool Parse(const json& body, ExecutionRequest& req, std::string& error) {
  return ParseRequest(body, LimitPolicy(), req, error);
}

} // namespace

TEST(RequestTest, Defaults) {
  ExecutionRequest req;
  std::string error;
  ASSERT_TRUE(Parse({{"code", "1 + 1"}}, req, error)) << error;
  LimitPolicy policy;
  EXPECT_EQ(req.source_code, "1 + 1");
  EXPECT_TRUE(req.bindings.is_object());
  EXPECT_TRUE(req.bindings.empty());
  EXPECT_EQ(req.limits.time, policy.defaults.time);
  EXPECT_EQ(req.limits.memory, policy.defaults.memory);
  EXPECT_EQ(req.limits.output, policy.defaults.output);
  // generated UUIDv4
  ASSERT_EQ(req.request_id.size(), 36u);
  EXPECT_EQ(req.request_id[14], '4');
}

TEST(RequestTest, AliasesAndLimits) {
  ExecutionRequest req;
  std::string error;
  json body = {
    {"source_code", "main"},
    {"bindings", {{"x", 3}, {"items", {1, 2}}}},
    {"time_limit_ms", 1500},
    {"memory_limit_bytes", 64L << 20},
    {"output_limit_bytes", 100},
    {"request_id", "req-1"},
  };
  ASSERT_TRUE(Parse(body, req, error)) << error;
  EXPECT_EQ(req.source_code, "main");
  EXPECT_EQ(req.bindings["x"], 3);
  EXPECT_EQ(req.limits.time, std::chrono::milliseconds(1500));
  EXPECT_EQ(req.limits.memory, 64L << 20);
  EXPECT_EQ(req.limits.output, 100);
  EXPECT_EQ(req.request_id, "req-1");

  ASSERT_TRUE(Parse({{"code", "x"}, {"params", {{"y", nullptr}}}}, req, error)) << error;
  EXPECT_TRUE(req.bindings.contains("y"));
}

TEST(RequestTest, NullLimitKeepsDefault) {
  ExecutionRequest req;
  std::string error;
  ASSERT_TRUE(Parse({{"code", ""}, {"time_limit_ms", nullptr}}, req, error)) << error;
  EXPECT_EQ(req.limits.time, LimitPolicy().defaults.time);
}

TEST(RequestTest, Malformed) {
  ExecutionRequest req;
  std::string error;
  EXPECT_FALSE(Parse(json::array(), req, error));
  EXPECT_FALSE(Parse(json::object(), req, error));
  EXPECT_EQ(error, "missing field: code");
  EXPECT_FALSE(Parse({{"code", 5}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"params", {1, 2}}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"time_limit_ms", "10"}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"time_limit_ms", 1.5}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"time_limit_ms", 0}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"output_limit_bytes", -1}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"request_id", 7}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"request_id", std::string(129, 'a')}}, req, error));
  EXPECT_FALSE(Parse({{"code", std::string(kMaxSourceSize + 1, ' ')}}, req, error));
}

TEST(RequestTest, CeilingsAreRejectedNotClamped) {
  ExecutionRequest req;
  std::string error;
  LimitPolicy policy;
  EXPECT_FALSE(Parse({{"code", "x"}, {"time_limit_ms", policy.maximums.time.count() + 1}}, req, error));
  EXPECT_EQ(error, "time_limit_ms must be within 1..60000");
  EXPECT_TRUE(Parse({{"code", "x"}, {"time_limit_ms", policy.maximums.time.count()}}, req, error)) << error;
  EXPECT_FALSE(Parse({{"code", "x"}, {"memory_limit_bytes", policy.maximums.memory + 1}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"memory_limit_bytes", kMinMemoryLimit - 1}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"output_limit_bytes", policy.maximums.output + 1}}, req, error));
  EXPECT_FALSE(Parse({{"code", "x"}, {"time_limit_ms", 18446744073709551615ULL}}, req, error));
}

TEST(RequestTest, ForbiddenBindingNames) {
  EXPECT_FALSE(IsForbiddenBindingName("x"));
  EXPECT_FALSE(IsForbiddenBindingName("_private"));
  EXPECT_FALSE(IsForbiddenBindingName("data2"));
  EXPECT_FALSE(IsForbiddenBindingName("__x"));
  EXPECT_TRUE(IsForbiddenBindingName(""));
  EXPECT_TRUE(IsForbiddenBindingName("2x"));
  EXPECT_TRUE(IsForbiddenBindingName("a-b"));
  EXPECT_TRUE(IsForbiddenBindingName("class"));
  EXPECT_TRUE(IsForbiddenBindingName("None"));
  EXPECT_TRUE(IsForbiddenBindingName("__builtins__"));
  EXPECT_TRUE(IsForbiddenBindingName("__import__"));
  EXPECT_TRUE(IsForbiddenBindingName("exit"));

  ExecutionRequest req;
  std::string error;
  EXPECT_FALSE(Parse({{"code", "x"}, {"params", {{"__builtins__", 1}}}}, req, error));
  EXPECT_EQ(error, "binding name not allowed: __builtins__");
}

TEST(RequestTest, ValidateAgainstStricterPolicy) {
  ExecutionRequest req;
  req.source_code = "x";
  req.limits = LimitPolicy().defaults;
  LimitPolicy strict;
  strict.maximums.time = std::chrono::milliseconds(1000);
  std::string error;
  EXPECT_TRUE(ValidateRequest(req, LimitPolicy(), error)) << error;
  EXPECT_FALSE(ValidateRequest(req, strict, error));
}
