#include "r4mbase/signal_handler.hpp"
#include "r4mbase/stderr_write.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

#include <redlog.hpp>

namespace r4mw4tch::signal_handler {

namespace {

struct cleanup_entry {
  cleanup_callback callback;
  int priority;
  std::string context;
};

std::mutex g_mutex;
std::vector<cleanup_entry> g_cleanups;
config g_config;
std::atomic<bool> g_initialized{false};
std::atomic<bool> g_cleanup_running{false};
std::atomic<bool> g_defer{false};
std::atomic<bool> g_interrupted{false};
redlog::logger g_log("r4mw4tch.signal_handler");

#ifdef _WIN32
BOOL WINAPI console_handler(DWORD ctrl_type) {
  if (ctrl_type != CTRL_C_EVENT) {
    return FALSE;
  }

  if (g_config.log_signals) {
    util::stderr_write("received ctrl+c signal\n");
  }

  if (g_defer) {
    if (g_interrupted.exchange(true)) {
      ExitProcess(1);
    }
    return TRUE;
  }

  run_cleanups();
  ExitProcess(1);
  return TRUE;
}
#else
void unix_handler(int signum, siginfo_t*, void*) {
  if (signum != SIGINT) {
    return;
  }

  if (g_config.log_signals) {
    util::stderr_write("received sigint signal\n");
  }

  // SA_RESETHAND already restored the default action for the next sigint
  if (g_defer) {
    g_interrupted = true;
    return;
  }

  run_cleanups();

  // restore default handler and re-raise to actually terminate
  signal(SIGINT, SIG_DFL);
  raise(SIGINT);
}
#endif

} // anonymous namespace

bool initialize(const config& cfg) {
  if (g_initialized.exchange(true)) {
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config = cfg;
    g_log = redlog::logger("r4mw4tch.signal_handler." + cfg.context_name);
  }
  g_defer = cfg.defer;
  g_interrupted = false;

  g_log.dbg(
      "installing interrupt handler", redlog::field("context", cfg.context_name), redlog::field("defer", cfg.defer)
  );

#ifdef _WIN32
  if (!SetConsoleCtrlHandler(console_handler, TRUE)) {
    g_log.err("failed to install console control handler");
    g_initialized = false;
    return false;
  }
#else
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_sigaction = unix_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_SIGINFO | SA_RESTART;
  if (cfg.defer) {
    sa.sa_flags |= SA_RESETHAND;
  }

  if (sigaction(SIGINT, &sa, nullptr) != 0) {
    g_log.err("failed to install signal handler", redlog::field("error", strerror(errno)));
    g_initialized = false;
    return false;
  }
#endif

  return true;
}

bool register_cleanup(cleanup_callback callback, int priority, const std::string& context) {
  if (!g_initialized) {
    return false;
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  g_cleanups.push_back({std::move(callback), priority, context});

  g_log.dbg("registered cleanup handler", redlog::field("context", context), redlog::field("priority", priority));
  return true;
}

void run_cleanups() {
  if (g_cleanup_running.exchange(true)) {
    return;
  }

  std::vector<cleanup_entry> cleanups;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    cleanups = g_cleanups;
  }

  std::stable_sort(cleanups.begin(), cleanups.end(), [](const cleanup_entry& a, const cleanup_entry& b) {
    return a.priority > b.priority;
  });

  for (const auto& cleanup : cleanups) {
    try {
      cleanup.callback();
    } catch (const std::exception& e) {
      // logger may not be usable here
      util::stderr_write("r4mw4tch: cleanup handler failed: ");
      util::stderr_write(e.what());
      util::stderr_write("\n");
    }
  }

  g_cleanup_running = false;
}

bool interrupted() { return g_interrupted; }

void shutdown() {
  if (!g_initialized.exchange(false)) {
    return;
  }
  g_defer = false;
  g_interrupted = false;

  {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_cleanups.clear();
  }

#ifdef _WIN32
  SetConsoleCtrlHandler(console_handler, FALSE);
#else
  signal(SIGINT, SIG_DFL);
#endif
}

guard::guard(const config& cfg) : initialized_(initialize(cfg)) {}

guard::~guard() {
  if (initialized_) {
    shutdown();
  }
}

} // namespace r4mw4tch::signal_handler
