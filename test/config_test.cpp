#include <map>
#include <fstream>

#include <unistd.h>
#include <gtest/gtest.h>
#include <codebox/config.h>
#include <codebox/paths.h>

namespace {

class EnvFixture {
  std::map<std::string, std::string> vars_;
 public:
  EnvFixture(std::initializer_list<std::map<std::string, std::string>::value_type> vars) : vars_(vars) {}
  EnvLookup Lookup() const {
    return [this](const char* key) -> const char* {
      auto it = vars_.find(key);
      return it == vars_.end() ? nullptr : it->second.c_str();
    };
  }
};

} // namespace

class ConfigFileTest : public ::testing::Test {
 protected:
  fs::path conf_path_;
  void SetUp() override {
    conf_path_ = kBoxRoot / ("config-test-" + std::to_string(getpid()) + ".conf");
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove(conf_path_, ec);
  }
  void Write(const std::string& content) {
    std::ofstream(conf_path_) << content;
  }
};

TEST_F(ConfigFileTest, Sections) {
  Write(
      "host = 127.0.0.1\n"
      "main_port = 9000\n"
      "log_level = DEBUG\n"
      "pool_capacity = 8\n"
      "queue_depth = 0\n"
      "\n"
      "[limits]\n"
      "max_time_limit_ms = 30000\n"
      "default_memory_limit_mib = 128\n"
      "max_output_limit_kib = 4096\n"
      "\n"
      "[sandbox]\n"
      "python = /usr/local/bin/python3\n"
      "blocked_modules = ctypes, socket\n"
      "sampling_interval_ms = 20\n");
  ServiceConfig conf;
  std::string error;
  ASSERT_TRUE(LoadConfigFile(conf_path_, conf, error)) << error;
  EXPECT_EQ(conf.host, "127.0.0.1");
  EXPECT_EQ(conf.main_port, 9000);
  EXPECT_EQ(conf.metrics_port, 18000);
  EXPECT_EQ(conf.log_level, "debug");
  EXPECT_EQ(conf.pool.capacity, 8);
  EXPECT_EQ(conf.pool.queue_depth, 0u);
  EXPECT_EQ(conf.limits.maximums.time, std::chrono::milliseconds(30000));
  EXPECT_EQ(conf.limits.defaults.time, LimitPolicy().defaults.time);
  EXPECT_EQ(conf.limits.defaults.memory, 128L << 20);
  EXPECT_EQ(conf.limits.maximums.output, 4096L << 10);
  EXPECT_EQ(conf.sandbox.python, fs::path("/usr/local/bin/python3"));
  EXPECT_EQ(conf.sandbox.blocked_modules, (std::vector<std::string>{"ctypes", "socket"}));
  EXPECT_EQ(conf.sandbox.sampling_interval, std::chrono::milliseconds(20));
  EXPECT_TRUE(ValidateConfig(conf, error)) << error;
}

TEST_F(ConfigFileTest, Missing) {
  ServiceConfig conf;
  std::string error;
  EXPECT_FALSE(LoadConfigFile(conf_path_, conf, error));
  EXPECT_NE(error.find(conf_path_.string()), std::string::npos);
}

TEST_F(ConfigFileTest, RangeCheckedBeforeScaling) {
  auto Rejects = [&](const std::string& content, const std::string& key) {
    Write(content);
    ServiceConfig conf;
    std::string error;
    EXPECT_FALSE(LoadConfigFile(conf_path_, conf, error)) << content;
    EXPECT_EQ(error.rfind(key + ": must be within", 0), 0u) << error;
    EXPECT_EQ(conf.limits.defaults.memory, LimitPolicy().defaults.memory);
  };
  Rejects("[limits]\ndefault_memory_limit_mib = -1\n", "default_memory_limit_mib");
  Rejects("[limits]\nmax_memory_limit_mib = 17592186044416\n", "max_memory_limit_mib");
  Rejects("[limits]\ndefault_output_limit_kib = 0\n", "default_output_limit_kib");
  Rejects("[limits]\nmax_output_limit_kib = 9007199254740992\n", "max_output_limit_kib");
  Rejects("main_port = 4294985376\n", "main_port");
  Rejects("pool_capacity = 4294967297\n", "pool_capacity");
}

TEST(ConfigTest, DefaultsAreValid) {
  ServiceConfig conf;
  std::string error;
  EXPECT_TRUE(ValidateConfig(conf, error)) << error;
}

TEST(ConfigTest, Environment) {
  EnvFixture env({
    {"SERVER_HOST", "::1"},
    {"LOG_LEVEL", "Info"},
    {"MAIN_PORT", "8080"},
    {"MAX_WORKERS", "2"},
    {"TIMEOUT", "3"},
    {"CODEBOX_QUEUE_DEPTH", "5"},
    {"CODEBOX_MAX_TIME_LIMIT_MS", "20000"},
    {"CODEBOX_DEFAULT_MEMORY_LIMIT_MIB", "64"},
    {"CODEBOX_MAX_MEMORY_LIMIT_MIB", "512"},
    {"CODEBOX_DEFAULT_OUTPUT_LIMIT_KIB", "16"},
    {"CODEBOX_MAX_OUTPUT_LIMIT_KIB", "2048"},
  });
  ServiceConfig conf;
  std::string error;
  ASSERT_TRUE(ApplyEnvironment(conf, error, env.Lookup())) << error;
  EXPECT_EQ(conf.host, "::1");
  EXPECT_EQ(conf.log_level, "info");
  EXPECT_EQ(conf.main_port, 8080);
  EXPECT_EQ(conf.pool.capacity, 2);
  EXPECT_EQ(conf.limits.defaults.time, std::chrono::milliseconds(3000));
  EXPECT_EQ(conf.pool.queue_depth, 5u);
  EXPECT_EQ(conf.limits.maximums.time, std::chrono::milliseconds(20000));
  EXPECT_EQ(conf.limits.defaults.memory, 64L << 20);
  EXPECT_EQ(conf.limits.maximums.memory, 512L << 20);
  EXPECT_EQ(conf.limits.defaults.output, 16L << 10);
  EXPECT_EQ(conf.limits.maximums.output, 2048L << 10);
  EXPECT_TRUE(ValidateConfig(conf, error)) << error;
}

TEST(ConfigTest, MillisecondTimeLimitWins) {
  EnvFixture env({{"TIMEOUT", "3"}, {"CODEBOX_DEFAULT_TIME_LIMIT_MS", "750"}});
  ServiceConfig conf;
  std::string error;
  ASSERT_TRUE(ApplyEnvironment(conf, error, env.Lookup())) << error;
  EXPECT_EQ(conf.limits.defaults.time, std::chrono::milliseconds(750));
}

TEST(ConfigTest, BadEnvironmentNamesKey) {
  ServiceConfig conf;
  std::string error;
  EXPECT_FALSE(ApplyEnvironment(conf, error, EnvFixture({{"MAX_WORKERS", "four"}}).Lookup()));
  EXPECT_EQ(error, "MAX_WORKERS: not an integer: \"four\"");
  EXPECT_FALSE(ApplyEnvironment(conf, error, EnvFixture({{"METRICS_PORT", "80x"}}).Lookup()));
  EXPECT_EQ(error.rfind("METRICS_PORT:", 0), 0u);
  EXPECT_FALSE(ApplyEnvironment(conf, error, EnvFixture({{"CODEBOX_QUEUE_DEPTH", "-1"}}).Lookup()));
  EXPECT_EQ(error.rfind("CODEBOX_QUEUE_DEPTH:", 0), 0u);
}

TEST(ConfigTest, OverflowingEnvironmentIsRejected) {
  auto Rejects = [](const std::string& key, const std::string& val) {
    ServiceConfig conf, untouched;
    std::string error;
    EXPECT_FALSE(ApplyEnvironment(conf, error, EnvFixture({{key, val}}).Lookup())) << key << "=" << val;
    EXPECT_EQ(error.rfind(key + ": must be within", 0), 0u) << error;
    EXPECT_EQ(conf.main_port, untouched.main_port);
    EXPECT_EQ(conf.pool.capacity, untouched.pool.capacity);
  };
  // both wrap to valid-looking ints when narrowed
  Rejects("MAIN_PORT", "4294985376");
  Rejects("MAX_WORKERS", "4294967297");
  Rejects("METRICS_PORT", "-1");
  Rejects("MAX_WORKERS", "0");
  Rejects("TIMEOUT", "9223372036854775");
  Rejects("CODEBOX_DEFAULT_TIME_LIMIT_MS", "0");
  Rejects("CODEBOX_MAX_TIME_LIMIT_MS", "600001");
  Rejects("CODEBOX_DEFAULT_MEMORY_LIMIT_MIB", "17592186044416");
  Rejects("CODEBOX_MAX_MEMORY_LIMIT_MIB", "-5");
  Rejects("CODEBOX_DEFAULT_OUTPUT_LIMIT_KIB", "9007199254740992");
  Rejects("CODEBOX_MAX_OUTPUT_LIMIT_KIB", "0");
}

TEST(ConfigTest, RejectsOutOfRange) {
  std::string error;
  auto Rejects = [&](auto&& modify, const std::string& key) {
    ServiceConfig conf;
    modify(conf);
    bool ok = ValidateConfig(conf, error);
    EXPECT_FALSE(ok) << key;
    if (!ok) EXPECT_EQ(error.rfind(key + ":", 0), 0u) << error;
  };
  Rejects([](ServiceConfig& c) { c.main_port = 0; }, "main_port");
  Rejects([](ServiceConfig& c) { c.metrics_port = c.main_port; }, "metrics_port");
  Rejects([](ServiceConfig& c) { c.log_level = "loud"; }, "log_level");
  Rejects([](ServiceConfig& c) { c.box_root = "relative/box"; }, "box_root");
  Rejects([](ServiceConfig& c) { c.pool.capacity = 0; }, "pool_capacity");
  Rejects([](ServiceConfig& c) { c.pool.capacity = kMaxPoolCapacity + 1; }, "pool_capacity");
  Rejects([](ServiceConfig& c) { c.limits.maximums.time = kAbsoluteMaxTime + std::chrono::milliseconds(1); },
          "max_time_limit_ms");
  Rejects([](ServiceConfig& c) { c.limits.defaults.time = c.limits.maximums.time * 2; },
          "default_time_limit_ms");
  Rejects([](ServiceConfig& c) { c.limits.defaults.memory = kMinMemoryLimit / 2; }, "default_memory_limit_mib");
  Rejects([](ServiceConfig& c) { c.limits.maximums.output = 0; }, "max_output_limit_kib");
  Rejects([](ServiceConfig& c) { c.sandbox.python = "python3"; }, "python");
  Rejects([](ServiceConfig& c) { c.sandbox.sampling_interval = std::chrono::milliseconds(0); },
          "sampling_interval_ms");
  Rejects([](ServiceConfig& c) { c.sandbox.blocked_modules = {"os path"}; }, "blocked_modules");
}
