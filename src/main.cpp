#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/pool.h>
#include <codebox/config.h>
#include <codebox/logger.h>
#include <codebox/metrics.h>
#include "codebox/paths.h"
#include "codebox/utils.h"
#include "server.h"

namespace {

const fs::path kDefaultConfig = "/etc/codebox.conf";

bool to_lock = true;

ServiceConfig ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default: /etc/codebox.conf if it exists)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of execution slots");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port of the execution API");
  parser.add_argument("--metrics-port")
    .scan<'d', int>()
    .help("Port of the metrics endpoint");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  ServiceConfig conf;
  std::string error;
  if (auto config_file = parser.present<std::string>("--config")) {
    if (!LoadConfigFile(config_file.value(), conf, error)) {
      spdlog::error("Failed to parse configuration file: {}", error);
      exit(1);
    }
  } else if (fs::exists(kDefaultConfig) && !LoadConfigFile(kDefaultConfig, conf, error)) {
    spdlog::error("Failed to parse configuration file: {}", error);
    exit(1);
  }
  if (!ApplyEnvironment(conf, error)) {
    spdlog::error("Invalid environment: {}", error);
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) conf.pool.capacity = val.value();
  if (auto val = parser.present<int>("--port")) conf.main_port = val.value();
  if (auto val = parser.present<int>("--metrics-port")) conf.metrics_port = val.value();
  to_lock = parser["--no-lock"] == false;
  if (!ValidateConfig(conf, error)) {
    spdlog::error("Invalid configuration: {}", error);
    exit(1);
  }

  if (verbosity == 0 && !conf.log_level.empty()) {
    spdlog::set_level(spdlog::level::from_str(conf.log_level));
  } else {
    switch (verbosity) {
      case 0: spdlog::set_level(spdlog::level::warn); break;
      case 1: spdlog::set_level(spdlog::level::info); break;
      default: spdlog::set_level(spdlog::level::debug); break;
    }
  }
  return conf;
}

bool LockFile() {
  fs::path lock_file = internal::kDataDir / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ServiceConfig conf = ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another codebox instance is running.");
    return 1;
  }
  kBoxRoot = conf.box_root;
  if (!CreateDirs(kBoxRoot, kPerm755)) return 1;

  // handled by sigwait below; blocked before any thread starts so that all threads inherit the mask
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
  signal(SIGPIPE, SIG_IGN);

  MetricsReporter metrics;
  ExecutionPool pool(conf.pool, MakeSandboxWorkerFactory(conf.sandbox), &metrics);
  CodeboxServer server(conf, pool, metrics);
  if (!server.Start()) return 1;

  int sig = 0;
  sigwait(&sigs, &sig);
  spdlog::warn("Received signal {}, shutting down", sig);
  pool.Shutdown();
  server.Stop();
}
