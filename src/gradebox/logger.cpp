#include <gradebox/logger.h>

#include <mutex>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

// Console sinks share one mutex. Holding it across fork() keeps a child
// from inheriting it locked by another thread.
void InitLogger() {
  static std::once_flag once;
  std::call_once(once, [] {
    spdlog::debug("Setup logger pthread_atfork");
    pthread_atfork(
        [] { spdlog::details::console_mutex::mutex().lock(); },
        [] { spdlog::details::console_mutex::mutex().unlock(); },
        [] { spdlog::details::console_mutex::mutex().unlock(); });
  });
}
