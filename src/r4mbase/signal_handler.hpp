#pragma once

#include <functional>
#include <string>

namespace r4mw4tch::signal_handler {

/**
 * @brief cleanup function run when the process is interrupted
 * should be fast; it runs from the signal path unless the handler is deferred
 */
using cleanup_callback = std::function<void()>;

/**
 * @brief configuration for signal handling behavior
 */
struct config {
  std::string context_name = "r4mtool"; ///< context name for logging
  bool log_signals = false;             ///< log signal reception for debugging
  /// only record the interrupt; the owner polls interrupted() and shuts down on its own thread.
  /// a second interrupt terminates the process.
  bool defer = false;
};

/**
 * @brief install the SIGINT (ctrl+c) handler
 * @return true if installation succeeded or the handler was already installed
 */
bool initialize(const config& cfg = {});

/**
 * @brief register a cleanup function to be called on interrupt
 * @param priority cleanup order (higher = called first)
 * @return true if registration succeeded
 */
bool register_cleanup(cleanup_callback callback, int priority = 0, const std::string& context = "");

/**
 * @brief run the registered cleanups now, highest priority first
 *
 * used by the signal path and directly by tests.
 */
void run_cleanups();

/**
 * @brief true once an interrupt arrived while the handler was deferred
 */
bool interrupted();

/**
 * @brief drop all registrations and restore the default handler
 */
void shutdown();

/**
 * @brief raii helper for signal handling setup/cleanup
 */
class guard {
public:
  explicit guard(const config& cfg = {});
  ~guard();

  guard(const guard&) = delete;
  guard& operator=(const guard&) = delete;
  guard(guard&&) = delete;
  guard& operator=(guard&&) = delete;

  bool is_initialized() const { return initialized_; }

private:
  bool initialized_;
};

} // namespace r4mw4tch::signal_handler
