#pragma once

#include <functional>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace detail {

enum Code : int {
  FG_RED = 31,
  FG_GREEN = 32,
  FG_YELLOW = 33,
  FG_BLUE = 34,
  FG_MAGENTA = 35,
  FG_CYAN = 36,
  FG_DEFAULT = 39,
  FG_LIGHT_RED = 91,
  FG_LIGHT_GREEN = 92,
  FG_LIGHT_YELLOW = 93,
  FG_LIGHT_BLUE = 94,
  FG_LIGHT_MAGENTA = 95,
  FG_LIGHT_CYAN = 96,
  BOLD = 1,
  DEFAULT = 0,
};

class Modifier {
  Code code;

public:
  Modifier(Code code) : code(code) {}

  static Modifier reset() { return Modifier(DEFAULT); }

  friend std::ostream &operator<<(std::ostream &os, const Modifier &mod) {
    return os << "\033[" << static_cast<int>(mod.code) << "m";
  }
};

enum class Mode {
  ERROR,
  DEBUG,
  INFO,
};

struct Tag {
  std::vector<Code> codes;
  size_t padding_right = 1;
  std::function<std::string()> metainfo = {};
};

} // namespace detail

class Logger {
public:
  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  void log_error(const std::string &tag, const std::string &message) {
    log(detail::Mode::ERROR, tag, message);
  }

  void log_debug(const std::string &tag, const std::string &message) {
    log(detail::Mode::DEBUG, tag, message);
  }

  void log_info(const std::string &tag, const std::string &message) {
    log(detail::Mode::INFO, tag, message);
  }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, detail::Tag> tags_; // guarded by mutex_

  Logger() { register_tags(); }

  void register_tags() {
    tags_["POOL"] = {{detail::Code::FG_LIGHT_BLUE}, 3};
    tags_["SYNC"] = {{detail::Code::FG_LIGHT_GREEN}, 3};
    tags_["MANUAL"] = {{detail::Code::FG_LIGHT_MAGENTA}};
    tags_["EXEC"] = {{detail::Code::FG_YELLOW}, 3};
    tags_["ASYNC"] = {{detail::Code::FG_LIGHT_CYAN}, 2};
    tags_["COUNTER"] = {{detail::Code::FG_MAGENTA}};
    tags_["CONFIG"] = {{detail::Code::FG_CYAN}, 1};
    tags_["SYSTEM"] = {{detail::Code::FG_CYAN}, 1};
    tags_["TID"] = {{detail::Code::FG_GREEN, detail::Code::BOLD}, 1, []() {
                      std::stringstream ss;
                      ss << std::this_thread::get_id();
                      return ss.str();
                    }};
    tags_["ERROR"] = {{detail::Code::FG_RED, detail::Code::BOLD}};
    tags_["DEBUG"] = {{detail::Code::FG_MAGENTA, detail::Code::BOLD}};
    tags_["INFO"] = {{detail::Code::FG_BLUE}, 2};
  }

  void print_tag(std::ostream &out, const std::string &tag) {
    auto &tag_info = tags_[tag];
    out << "[";
    for (const auto &code : tag_info.codes) {
      out << detail::Modifier(code);
    }
    out << tag;
    out << detail::Modifier::reset();
    if (tag_info.metainfo) {
      out << ": " << tag_info.metainfo();
    }
    out << "]";
    out << std::string(tag_info.padding_right, ' ');
  }

  void log(detail::Mode mode, const std::string &tag,
           const std::string &message) {
    std::lock_guard lock(mutex_);
    auto &out = mode == detail::Mode::ERROR ? std::cerr : std::cout;
    switch (mode) {
    case detail::Mode::ERROR:
      print_tag(out, "ERROR");
      break;
    case detail::Mode::DEBUG:
      print_tag(out, "DEBUG");
      break;
    case detail::Mode::INFO:
      print_tag(out, "INFO");
      break;
    default:
      break;
    }
    print_tag(out, "TID");
    print_tag(out, tag);
    out << message << std::endl;
  }
};

// Level of verbosity, set by the build:
// LOG_LEVEL_ERROR, LOG_LEVEL_INFO or LOG_LEVEL_DEBUG

#if defined(LOG_LEVEL_ERROR) || defined(LOG_LEVEL_INFO) ||                     \
    defined(LOG_LEVEL_DEBUG)
#define LOG_ERROR(tag, message) (Logger::instance().log_error(tag, message))
#else
#define LOG_ERROR(tag, message) (true)
#endif

#if defined(LOG_LEVEL_INFO) || defined(LOG_LEVEL_DEBUG)
#define LOG_INFO(tag, message) (Logger::instance().log_info(tag, message))
#else
#define LOG_INFO(tag, message) (true)
#endif

#ifdef LOG_LEVEL_DEBUG
#define LOG_DEBUG(tag, message) (Logger::instance().log_debug(tag, message))
#else
#define LOG_DEBUG(tag, message) (true)
#endif

// Util functions for the logging

inline std::string ToString(const std::error_code &ec) {
  return ec.category().name() + std::string(": ") + ec.message();
}
