#pragma once

#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace r4mw4tch::util {

/**
 * @brief write to stderr without touching iostreams or the logger
 *
 * safe to call from signal handlers and from catch blocks entered while the
 * logging backend may itself be failing.
 */
inline void stderr_write(const char* message) {
  if (!message) {
    return;
  }

#ifdef _WIN32
  HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
  if (handle != INVALID_HANDLE_VALUE) {
    DWORD written;
    WriteFile(handle, message, static_cast<DWORD>(strlen(message)), &written, NULL);
  }
#else
  ssize_t ignored = write(STDERR_FILENO, message, strlen(message));
  (void) ignored;
#endif
}

} // namespace r4mw4tch::util
