/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_SCHEMA_HPP
#define LIBHAPKIT_SCHEMA_HPP

#include "typed_value.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hapkit
{
  /// Line type symbol in column 1.
  enum class line_type : char
  {
    haplotype = 'H',
    variant = 'V'
  };

  inline char line_type_symbol(line_type t) { return static_cast<char>(t); }

  class field_declaration
  {
  public:
    line_type type;
    std::string name;
    format_tag format;
    std::string description;
  };

  inline bool operator==(const field_declaration& lhs, const field_declaration& rhs)
  {
    return lhs.type == rhs.type && lhs.name == rhs.name && lhs.format == rhs.format && lhs.description == rhs.description;
  }

  inline bool operator!=(const field_declaration& lhs, const field_declaration& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * Ordered extra field declarations per line type. Declaration order fixes
   * the column position of each extra field. Readers and writers hold a
   * schema as std::shared_ptr<const schema> once it is complete.
   */
  class schema
  {
  public:
    schema() {}

    /**
     * Appends a declaration.
     * @param type Line type the field belongs to
     * @param name Field name (unique per line type)
     * @param format Resolved format tag
     * @param description Free text
     * @throws duplicate_field_error if name is already declared for type
     */
    schema& declare(line_type type, const std::string& name, const format_tag& format, const std::string& description = "");

    /**
     * Appends a declaration with a textual format tag (e.g. ".2f").
     * @throws type_coercion_error for unsupported tags
     */
    schema& declare(line_type type, const std::string& name, const std::string& format, const std::string& description = "");

    /**
     * Parses a "#H\t<name>\t<format>\t<description>" header line and declares it.
     */
    void declare_from_line(const std::string& line, std::size_t line_number = 0);

    const std::vector<field_declaration>& fields_for(line_type type) const { return entries_[slot(type)]; }

    /**
     * Gets column offset of an extra field among the extra columns.
     * @return -1 if name is not declared for type
     */
    int field_index(line_type type, const std::string& name) const;

    bool empty() const { return entries_[0].empty() && entries_[1].empty(); }

    /**
     * Regenerates declaration lines, H declarations first.
     */
    std::vector<std::string> declaration_lines() const;

    static bool is_declaration_line(const std::string& line);

    friend bool operator==(const schema& lhs, const schema& rhs);
  private:
    static std::size_t slot(line_type type) { return type == line_type::haplotype ? 0 : 1; }

    std::array<std::vector<field_declaration>, 2> entries_;
    std::array<std::unordered_map<std::string, std::size_t>, 2> name_to_idx_;
  };

  inline bool operator==(const schema& lhs, const schema& rhs)
  {
    return lhs.entries_ == rhs.entries_;
  }

  inline bool operator!=(const schema& lhs, const schema& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif // LIBHAPKIT_SCHEMA_HPP
