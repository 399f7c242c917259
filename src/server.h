#ifndef SERVER_H_
#define SERVER_H_

#include <thread>

#include <httplib.h>
#include <codebox/pool.h>
#include <codebox/config.h>
#include <codebox/metrics.h>

// POST /execute and GET /health on the main port, GET /metrics on the metrics port
class CodeboxServer {
  const ServiceConfig& conf_;
  ExecutionPool& pool_;
  MetricsReporter& metrics_;
  httplib::Server main_, metrics_server_;
  std::thread main_thread_, metrics_thread_;

  void HandleExecute_(const httplib::Request&, httplib::Response&);
  void HandleHealth_(const httplib::Request&, httplib::Response&);
  void HandleMetrics_(const httplib::Request&, httplib::Response&);
 public:
  CodeboxServer(const ServiceConfig&, ExecutionPool&, MetricsReporter&);
  ~CodeboxServer();

  // binds both ports and starts serving in the background
  bool Start();
  // stops accepting and waits for in-flight requests
  void Stop();
};

#endif  // SERVER_H_
