/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_UTILITY_HPP
#define LIBHAPKIT_UTILITY_HPP

#include <sys/stat.h>
#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <utility>

namespace hapkit
{
  namespace detail
  {
    inline
    std::vector<std::string> split_string_to_vector(const char* in, const char* in_end, char delim)
    {
      std::vector<std::string> ret;
      const char* d = nullptr;
      const char* s = in;
      while ((d = std::find(s, in_end, delim)) != in_end)
      {
        ret.emplace_back(std::string(s, d));
        s = d + 1;
      }
      ret.emplace_back(std::string(s, d));
      return ret;
    }

    inline
    std::vector<std::string> split_string_to_vector(const std::string& in, char delim)
    {
      return split_string_to_vector(in.data(), in.data() + in.size(), delim);
    }

    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args)
    {
      return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }

    inline bool file_exists(const std::string& file_path)
    {
      struct stat st;
      return (stat(file_path.c_str(), &st) == 0);
    }

    inline bool has_extension(const std::string& full_string, const std::string& ext)
    {
      if (full_string.length() >= ext.length())
        return (0 == full_string.compare(full_string.length() - ext.length(), ext.length(), ext));
      return false;
    }

    /**
     * Parses an unsigned decimal integer that must span the whole string.
     * @param s Input string
     * @param dest Destination value
     * @return False if s is empty, has non-digit characters or overflows
     */
    inline bool parse_uint64(const std::string& s, std::uint64_t& dest)
    {
      if (s.empty() || s.size() > 20)
        return false;

      std::uint64_t ret = 0;
      for (auto it = s.begin(); it != s.end(); ++it)
      {
        if (*it < '0' || *it > '9')
          return false;
        std::uint64_t digit = std::uint64_t(*it - '0');
        if (ret > (std::uint64_t(-1) - digit) / 10)
          return false;
        ret = ret * 10 + digit;
      }

      dest = ret;
      return true;
    }
  }
}

#endif // LIBHAPKIT_UTILITY_HPP
