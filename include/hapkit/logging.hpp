/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_LOGGING_HPP
#define LIBHAPKIT_LOGGING_HPP

#include <unordered_set>
#include <string>
#include <mutex>
#include <cstdio>
#include <iostream>

namespace hapkit
{
  enum class log_level : int
  {
    debug = 10,
    info = 20,
    warning = 30,
    error = 40,
    critical = 50
  };

  inline const char* log_level_name(log_level lvl)
  {
    switch (lvl)
    {
    case log_level::debug: return "DEBUG";
    case log_level::info: return "INFO";
    case log_level::warning: return "WARNING";
    case log_level::error: return "ERROR";
    case log_level::critical: return "CRITICAL";
    }
    return "";
  }

  template <typename T = void>
  class logging
  {
  private:
    static std::unordered_set<std::string> distinct_messages_;
    static log_level threshold_;
    static std::mutex mtx_;

    template<typename... A>
    static std::string format(log_level lvl, const char* fmt, A ...args)
    {
      std::string buf(512, '\0');
      int prefix_sz = std::snprintf(&buf[0], buf.size(), "[%8s] ", log_level_name(lvl));
      if (prefix_sz < 0)
        return std::string();

      int sz = std::snprintf(&buf[prefix_sz], buf.size() - prefix_sz, fmt, args...);
      if (sz < 0)
        return std::string();

      if (std::size_t(prefix_sz + sz) >= buf.size())
      {
        buf.resize(prefix_sz + sz + 1);
        std::snprintf(&buf[prefix_sz], buf.size() - prefix_sz, fmt, args...);
      }

      buf.resize(prefix_sz + sz);
      buf.push_back('\n');
      return buf;
    }
  public:
    static void set_level(log_level lvl) { threshold_ = lvl; }
    static log_level level() { return threshold_; }
    static bool enabled(log_level lvl) { return int(lvl) >= int(threshold_); }

    template<typename... A>
    static void log(log_level lvl, const char* fmt, A ...args)
    {
      if (!enabled(lvl))
        return;

      std::string msg = format(lvl, fmt, args...);
      if (msg.empty())
        return std::cerr << "Warning: Log failed\n", void();

      std::lock_guard<std::mutex> lock(mtx_);
      std::cerr.write(msg.data(), msg.size());
    }

    /**
     * Logs message only the first time it is seen.
     */
    template<typename... A>
    static void cerr_once(log_level lvl, const char* fmt, A ...args)
    {
      if (!enabled(lvl))
        return;

      std::string msg = format(lvl, fmt, args...);
      if (msg.empty())
        return std::cerr << "Warning: Log failed\n", void();

      std::lock_guard<std::mutex> lock(mtx_);
      if (distinct_messages_.insert(msg).second)
        std::cerr.write(msg.data(), msg.size());
    }
  };

  template <typename T>
  std::unordered_set<std::string> logging<T>::distinct_messages_;

  template <typename T>
  log_level logging<T>::threshold_ = log_level::error;

  template <typename T>
  std::mutex logging<T>::mtx_;

  typedef logging<> logger;
}

#endif // LIBHAPKIT_LOGGING_HPP
