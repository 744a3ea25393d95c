#pragma once

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "util/logging.hpp"

// Unrecoverable failure of a syscall that has no error path upwards
#define CANNOT_FAIL(code, message)                                             \
  do {                                                                         \
    if ((code) == -1) {                                                        \
      std::stringstream ss;                                                    \
      ss << "Syscall failed with message: " << message                         \
         << " | errno: " << std::strerror(errno);                              \
      Logger::instance().log_error("SYSTEM", ss.str());                        \
      std::exit(1);                                                            \
    }                                                                          \
  } while (false)
