/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_TYPED_VALUE_HPP
#define LIBHAPKIT_TYPED_VALUE_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace hapkit
{
  enum class value_kind : std::uint8_t
  {
    empty = 0,
    integer,
    real,
    string
  };

  const char* value_kind_name(value_kind k);

  /**
   * Resolved extra field format, e.g. "d", "s", "f" or ".2f".
   */
  class format_tag
  {
  public:
    static const int default_precision = 6;
    static const int max_precision = 17;

    format_tag() : kind_(value_kind::string), precision_(0) {}

    /**
     * Parses the format column of a schema declaration.
     * @param tag Format text
     * @return Resolved tag
     * @throws type_coercion_error if tag is not one of the supported forms
     */
    static format_tag parse(const std::string& tag);

    static format_tag integer() { return format_tag(value_kind::integer, 0); }
    static format_tag string() { return format_tag(value_kind::string, 0); }
    static format_tag real(int precision = default_precision) { return format_tag(value_kind::real, precision); }

    value_kind kind() const { return kind_; }
    int precision() const { return precision_; }

    /**
     * Gets canonical tag text. For reals the explicit ".Nf" form is used
     * unless the tag was declared as plain "f".
     */
    std::string str() const;
  private:
    format_tag(value_kind k, int precision, bool bare = false) : kind_(k), precision_(precision), bare_(bare) {}

    value_kind kind_;
    int precision_;
    bool bare_ = false;
  };

  inline bool operator==(const format_tag& lhs, const format_tag& rhs)
  {
    return lhs.kind() == rhs.kind() && lhs.precision() == rhs.precision();
  }

  inline bool operator!=(const format_tag& lhs, const format_tag& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * Scalar value of an extra field.
   */
  class typed_value
  {
  public:
    typed_value() {}

    template <typename T, typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
    typed_value(T v) : kind_(value_kind::integer), int_(static_cast<std::int64_t>(v)) {}

    template <typename T, typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    typed_value(T v) : kind_(value_kind::real), real_(static_cast<double>(v)) {}

    typed_value(std::string v) : kind_(value_kind::string), str_(std::move(v)) {}
    typed_value(const char* v) : kind_(value_kind::string), str_(v) {}

    value_kind kind() const { return kind_; }
    bool empty() const { return kind_ == value_kind::empty; }

    /**
     * Gets value.
     * @param dest Destination
     * @return False if the stored kind cannot be represented by T
     */
    template <typename T>
    typename std::enable_if<std::is_arithmetic<T>::value, bool>::type get(T& dest) const
    {
      if (kind_ == value_kind::integer)
        dest = static_cast<T>(int_);
      else if (kind_ == value_kind::real && std::is_floating_point<T>::value)
        dest = static_cast<T>(real_);
      else
        return false;
      return true;
    }

    bool get(std::string& dest) const
    {
      if (kind_ != value_kind::string)
        return false;
      dest = str_;
      return true;
    }

    /**
     * Parses column text according to a format tag.
     * @param text Column text
     * @param tag Declared format
     * @param field_name Used in error messages
     * @param line_number Used in error messages
     * @throws type_coercion_error
     */
    static typed_value parse(const std::string& text, const format_tag& tag, const std::string& field_name = "", std::size_t line_number = 0);

    /**
     * Renders value according to a format tag. Reals are rounded from their
     * exact binary value to tag.precision() decimals, with exact ties rounded
     * half to even.
     * @throws type_coercion_error if the value is empty or cannot be written with tag
     */
    std::string format(const format_tag& tag, const std::string& field_name = "") const;

    /**
     * Compares two values as they would be serialized with tag.
     */
    static bool equivalent(const typed_value& a, const typed_value& b, const format_tag& tag);

    friend bool operator==(const typed_value& lhs, const typed_value& rhs);
  private:
    value_kind kind_ = value_kind::empty;
    std::int64_t int_ = 0;
    double real_ = 0.;
    std::string str_;
  };

  bool operator==(const typed_value& lhs, const typed_value& rhs);

  inline bool operator!=(const typed_value& lhs, const typed_value& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif // LIBHAPKIT_TYPED_VALUE_HPP
