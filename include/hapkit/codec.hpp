/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_CODEC_HPP
#define LIBHAPKIT_CODEC_HPP

#include "record.hpp"
#include "schema.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hapkit
{
  /**
   * Converts between data lines and records. Lines are passed without the
   * trailing newline.
   */
  class codec
  {
  public:
    static const std::size_t haplotype_mandatory_columns = 4;
    static const std::size_t variant_mandatory_columns = 5;

    /**
     * Gets line type from column 1.
     * @throws malformed_line_error if column 1 is not "H" or "V"
     */
    static line_type detect(const std::string& line, std::size_t line_number = 0);

    static haplotype parse_haplotype(const std::string& line, const schema& s, std::size_t line_number = 0);
    static variant parse_variant(const std::string& line, const schema& s, std::size_t line_number = 0);

    /**
     * Parses H or V line into dest.
     * @param line Data line
     * @param s Schema of the file
     * @param dest Destination record
     * @param line_number 1-based line number for diagnostics
     * @throws malformed_line_error, undeclared_field_error, type_coercion_error
     */
    static void parse(const std::string& line, const schema& s, record& dest, std::size_t line_number = 0);

    /**
     * Appends serialized line (without newline) to dest.
     * @throws malformed_line_error, undeclared_field_error, type_coercion_error
     */
    static void serialize(const haplotype& h, const schema& s, std::string& dest);
    static void serialize(const variant& v, const schema& s, std::string& dest);
    static void serialize(const record& r, const schema& s, std::string& dest);

    template <typename T>
    static std::string serialize(const T& r, const schema& s)
    {
      std::string ret;
      serialize(r, s, ret);
      return ret;
    }
  private:
    static std::vector<std::string> split_columns(const std::string& line, line_type type, const schema& s, std::size_t line_number);
    static std::uint64_t parse_position(const std::string& col, const char* name, std::size_t line_number);
    static void parse_extra(const std::vector<std::string>& cols, std::size_t offset, line_type type, const schema& s, extra_field_list& dest, std::size_t line_number);
    static void append_text_column(const std::string& val, const char* name, std::string& dest);
    static void append_extra(const extra_fields& rec, line_type type, const schema& s, std::string& dest);
  };
}

#endif // LIBHAPKIT_CODEC_HPP
