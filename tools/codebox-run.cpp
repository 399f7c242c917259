// Runs one piece of code through the same pool and sandbox as the server and
//  prints the response envelope. Needs root, like the server.
#include <signal.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <limits>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codebox/pool.h>
#include <codebox/paths.h>
#include <codebox/config.h>
#include <codebox/logger.h>
#include <codebox/collector.h>

namespace {

std::string ReadSource(const std::string& path) {
  std::stringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) throw std::runtime_error("cannot open " + path);
    ss << fin.rdbuf();
  }
  return ss.str();
}

} // namespace

int main(int argc, char** argv) {
  signal(SIGPIPE, SIG_IGN);
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  int verbosity = 0;
  argparse::ArgumentParser parser("codebox-run");
  parser.add_argument("file")
    .help("Python source file, or - for stdin");
  parser.add_argument("-c", "--config")
    .help("Configuration file for limits and sandbox settings");
  parser.add_argument("-P", "--params")
    .default_value(std::string("{}"))
    .help("Bindings as a JSON object");
  parser.add_argument("-t", "--time-limit-ms")
    .scan<'d', long>()
    .help("Time limit in milliseconds");
  parser.add_argument("-m", "--memory-limit-mib")
    .scan<'d', long>()
    .help("Memory limit in MiB");
  parser.add_argument("-o", "--output-limit-kib")
    .scan<'d', long>()
    .help("Output limit in KiB");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 2;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 2;
  }

  ServiceConfig conf;
  std::string error;
  if (auto config_file = parser.present<std::string>("--config");
      config_file && !LoadConfigFile(config_file.value(), conf, error)) {
    spdlog::error("Failed to parse configuration file: {}", error);
    return 2;
  }
  if (!ValidateConfig(conf, error)) {
    spdlog::error("Invalid configuration: {}", error);
    return 2;
  }
  kBoxRoot = conf.box_root;

  nlohmann::json body;
  try {
    body["code"] = ReadSource(parser.get<std::string>("file"));
    body["params"] = nlohmann::json::parse(parser.get<std::string>("--params"));
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 2;
  }
  if (auto val = parser.present<long>("--time-limit-ms")) body["time_limit_ms"] = val.value();
  auto Scaled = [&](const char* flag, const char* key, int shift) {
    auto val = parser.present<long>(flag);
    if (!val) return true;
    if (val.value() < 1 || val.value() > (std::numeric_limits<long>::max() >> shift)) {
      spdlog::error("{}: out of range: {}", flag, val.value());
      return false;
    }
    body[key] = val.value() << shift;
    return true;
  };
  if (!Scaled("--memory-limit-mib", "memory_limit_bytes", 20) ||
      !Scaled("--output-limit-kib", "output_limit_bytes", 10)) {
    return 2;
  }

  ExecutionRequest request;
  ResponseEnvelope env;
  if (!ParseRequest(body, conf.limits, request, error)) {
    env = InvalidRequestEnvelope(error);
  } else {
    std::error_code ec;
    fs::create_directories(kBoxRoot, ec);
    if (ec) {
      spdlog::error("Cannot create {}: {}", kBoxRoot.string(), ec.message());
      return 2;
    }
    PoolOptions options;
    options.capacity = 1;
    options.queue_depth = 0;
    ExecutionPool pool(options, MakeSandboxWorkerFactory(conf.sandbox));
    CancelToken cancel;
    try {
      env = Collect(pool.Submit(request, cancel));
    } catch (const SandboxError& e) {
      env = InternalErrorEnvelope(e.what());
    }
  }
  env.request_id = request.request_id;
  std::cout << env.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return env.status == Status::OK ? 0 : 1;
}
