/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/typed_value.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/utility.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cctype>

namespace hapkit
{
  const int format_tag::default_precision;
  const int format_tag::max_precision;

  const char* value_kind_name(value_kind k)
  {
    switch (k)
    {
    case value_kind::empty: return "empty";
    case value_kind::integer: return "integer";
    case value_kind::real: return "float";
    case value_kind::string: return "string";
    }
    return "";
  }

  format_tag format_tag::parse(const std::string& tag)
  {
    if (tag == "d")
      return format_tag::integer();
    if (tag == "s")
      return format_tag::string();
    if (tag == "f")
      return format_tag(value_kind::real, default_precision, true);

    if (tag.size() >= 3 && tag.front() == '.' && tag.back() == 'f')
    {
      const std::string digits = tag.substr(1, tag.size() - 2);
      std::uint64_t precision = 0;
      // No leading zeros, so str() reproduces the tag.
      if ((digits.size() == 1 || digits[0] != '0') && detail::parse_uint64(digits, precision) && precision <= std::uint64_t(max_precision))
        return format_tag::real(int(precision));
    }

    throw type_coercion_error("unsupported format tag '" + tag + "'");
  }

  std::string format_tag::str() const
  {
    switch (kind_)
    {
    case value_kind::integer: return "d";
    case value_kind::string: return "s";
    case value_kind::real: return bare_ ? "f" : "." + std::to_string(precision_) + "f";
    default: return "";
    }
  }

  typed_value typed_value::parse(const std::string& text, const format_tag& tag, const std::string& field_name, std::size_t line_number)
  {
    switch (tag.kind())
    {
    case value_kind::string:
      return typed_value(text);
    case value_kind::integer:
    {
      const char* s = text.c_str();
      if (!text.empty() && (std::isdigit((unsigned char)s[0]) || ((s[0] == '-' || s[0] == '+') && text.size() > 1)))
      {
        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(s, &end, 10);
        if (errno == 0 && end == s + text.size())
          return typed_value(std::int64_t(v));
      }
      break;
    }
    case value_kind::real:
    {
      const char* s = text.c_str();
      if (!text.empty() && !std::isspace((unsigned char)s[0]))
      {
        char* end = nullptr;
        double v = std::strtod(s, &end);
        // Overflow yields HUGE_VAL; underflow is accepted.
        if (end == s + text.size() && std::isfinite(v))
          return typed_value(v);
      }
      break;
    }
    case value_kind::empty:
      break;
    }

    throw type_coercion_error("cannot parse '" + text + "' as " + value_kind_name(tag.kind()) + (field_name.empty() ? "" : " for field " + field_name), line_number);
  }

  std::string typed_value::format(const format_tag& tag, const std::string& field_name) const
  {
    const std::string suffix = field_name.empty() ? "" : " for field " + field_name;

    if (tag.kind() == value_kind::string && kind_ == value_kind::string)
      return str_;

    if (tag.kind() == value_kind::integer && kind_ == value_kind::integer)
      return std::to_string(int_);

    if (tag.kind() == value_kind::real && (kind_ == value_kind::real || kind_ == value_kind::integer))
    {
      double v = kind_ == value_kind::real ? real_ : double(int_);
      if (!std::isfinite(v))
        throw type_coercion_error("non-finite value" + suffix);

      std::string buf(64, '\0');
      int sz = std::snprintf(&buf[0], buf.size(), "%.*f", tag.precision(), v);
      if (sz < 0)
        throw type_coercion_error("failed to format value" + suffix);
      if (std::size_t(sz) >= buf.size())
      {
        buf.resize(sz + 1);
        std::snprintf(&buf[0], buf.size(), "%.*f", tag.precision(), v);
      }
      buf.resize(sz);
      return buf;
    }

    throw type_coercion_error(std::string("cannot write ") + value_kind_name(kind_) + " value as " + value_kind_name(tag.kind()) + suffix);
  }

  bool typed_value::equivalent(const typed_value& a, const typed_value& b, const format_tag& tag)
  {
    if (a.empty() || b.empty())
      return a.empty() && b.empty();

    try
    {
      return a.format(tag) == b.format(tag);
    }
    catch (const type_coercion_error&)
    {
      return a == b;
    }
  }

  bool operator==(const typed_value& lhs, const typed_value& rhs)
  {
    if (lhs.kind_ != rhs.kind_)
      return false;

    switch (lhs.kind_)
    {
    case value_kind::integer: return lhs.int_ == rhs.int_;
    case value_kind::real: return lhs.real_ == rhs.real_;
    case value_kind::string: return lhs.str_ == rhs.str_;
    case value_kind::empty: return true;
    }
    return false;
  }
}
