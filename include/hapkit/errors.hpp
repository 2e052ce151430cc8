/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_ERRORS_HPP
#define LIBHAPKIT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace hapkit
{
  /**
   * Base class of every error caused by file contents. Line numbers are
   * 1-based; zero means the error is not tied to a single line.
   */
  class format_error : public std::runtime_error
  {
  public:
    format_error(const std::string& what_arg, std::size_t line_number = 0) :
      std::runtime_error(line_number ? "line " + std::to_string(line_number) + ": " + what_arg : what_arg),
      line_number_(line_number)
    {
    }

    std::size_t line_number() const { return line_number_; }
  private:
    std::size_t line_number_;
  };

  class malformed_line_error : public format_error
  {
  public:
    using format_error::format_error;
  };

  /// Data line carries more extra columns than the schema declares.
  class undeclared_field_error : public malformed_line_error
  {
  public:
    using malformed_line_error::malformed_line_error;
  };

  class type_coercion_error : public format_error
  {
  public:
    using format_error::format_error;
  };

  class duplicate_field_error : public format_error
  {
  public:
    using format_error::format_error;
  };

  class duplicate_haplotype_error : public format_error
  {
  public:
    using format_error::format_error;
  };

  class unsorted_file_error : public format_error
  {
  public:
    using format_error::format_error;
  };

  class dangling_variant_error : public format_error
  {
  public:
    struct reference
    {
      std::string variant_id;
      std::string haplotype_id;
      std::size_t line_number;
    };

    dangling_variant_error(std::vector<reference> refs) :
      format_error(make_message(refs), refs.size() == 1 ? refs.front().line_number : 0),
      references_(std::move(refs))
    {
    }

    const std::vector<reference>& references() const { return references_; }
  private:
    static std::string make_message(const std::vector<reference>& refs)
    {
      if (refs.size() == 1)
        return "variant " + refs.front().variant_id + " references unknown haplotype " + refs.front().haplotype_id;

      std::string ret = std::to_string(refs.size()) + " variants reference unknown haplotypes:";
      for (auto it = refs.begin(); it != refs.end(); ++it)
      {
        ret += " " + it->variant_id + "->" + it->haplotype_id;
        if (it->line_number)
          ret += " (line " + std::to_string(it->line_number) + ")";
      }
      return ret;
    }

    std::vector<reference> references_;
  };

  class io_error : public std::runtime_error
  {
  public:
    io_error(const std::string& what_arg, const std::string& path) :
      std::runtime_error(what_arg + " (" + path + ")"),
      path_(path)
    {
    }

    const std::string& path() const { return path_; }
  private:
    std::string path_;
  };
}

#endif // LIBHAPKIT_ERRORS_HPP
