#include <codebox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

// The console sinks of the default logger share this mutex. A child forked
//  while another thread holds it would deadlock on its first log line.
using console_mutex = spdlog::details::console_mutex;

namespace {

void Prepare() {
  console_mutex::mutex().lock();
}

void Parent() {
  console_mutex::mutex().unlock();
}

void Child() {
  console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
