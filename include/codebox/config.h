#ifndef INCLUDE_CODEBOX_CONFIG_H_
#define INCLUDE_CODEBOX_CONFIG_H_

#include <string>
#include <cstdlib>
#include <functional>
#include <filesystem>

#include "pool.h"
#include "request.h"
#include "worker.h"

struct ServiceConfig {
  std::string host;
  int main_port;
  int metrics_port;
  std::string log_level; // empty = decided by command line verbosity
  std::filesystem::path box_root;
  PoolOptions pool;
  LimitPolicy limits;
  SandboxSettings sandbox;

  ServiceConfig() :
      host("0.0.0.0"),
      main_port(18080),
      metrics_port(18000),
      box_root("/tmp/codebox") {}
};

using EnvLookup = std::function<const char*(const char*)>;

// Each step overrides only what it finds; on failure error names the offending key.
// A missing file is reported as an error; callers decide whether that matters.
bool LoadConfigFile(const std::filesystem::path&, ServiceConfig&, std::string& error);
bool ApplyEnvironment(ServiceConfig&, std::string& error, const EnvLookup& lookup = ::getenv);
// Rejects (never clamps) out-of-range settings
bool ValidateConfig(const ServiceConfig&, std::string& error);

#endif  // INCLUDE_CODEBOX_CONFIG_H_
