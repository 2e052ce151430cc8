/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/schema.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/utility.hpp"

namespace hapkit
{
  schema& schema::declare(line_type type, const std::string& name, const format_tag& format, const std::string& description)
  {
    if (name.empty())
      throw malformed_line_error("empty extra field name");

    if (name.find_first_of("\t\n") != std::string::npos || description.find_first_of("\t\n") != std::string::npos)
      throw malformed_line_error("extra field declaration for " + name + " contains a tab or newline");

    std::size_t s = slot(type);
    auto insert_res = name_to_idx_[s].insert(std::make_pair(name, entries_[s].size()));
    if (!insert_res.second)
      throw duplicate_field_error(std::string("field ") + name + " declared twice for " + line_type_symbol(type) + " lines");

    field_declaration d;
    d.type = type;
    d.name = name;
    d.format = format;
    d.description = description;
    entries_[s].emplace_back(std::move(d));
    return *this;
  }

  schema& schema::declare(line_type type, const std::string& name, const std::string& format, const std::string& description)
  {
    return declare(type, name, format_tag::parse(format), description);
  }

  bool schema::is_declaration_line(const std::string& line)
  {
    return line.size() >= 3 && line[0] == '#' && (line[1] == 'H' || line[1] == 'V') && line[2] == '\t';
  }

  void schema::declare_from_line(const std::string& line, std::size_t line_number)
  {
    if (!is_declaration_line(line))
      throw malformed_line_error("not an extra field declaration", line_number);

    std::vector<std::string> cols = detail::split_string_to_vector(line, '\t');
    if (cols.size() != 4)
      throw malformed_line_error("extra field declaration must have 4 columns, found " + std::to_string(cols.size()), line_number);

    line_type type = line[1] == 'H' ? line_type::haplotype : line_type::variant;
    try
    {
      declare(type, cols[1], format_tag::parse(cols[2]), cols[3]);
    }
    catch (const duplicate_field_error& e)
    {
      throw duplicate_field_error(e.what(), line_number);
    }
    catch (const type_coercion_error& e)
    {
      throw type_coercion_error(e.what(), line_number);
    }
    catch (const malformed_line_error& e)
    {
      throw malformed_line_error(e.what(), line_number);
    }
  }

  int schema::field_index(line_type type, const std::string& name) const
  {
    auto res = name_to_idx_[slot(type)].find(name);
    if (res == name_to_idx_[slot(type)].end())
      return -1;
    return int(res->second);
  }

  std::vector<std::string> schema::declaration_lines() const
  {
    std::vector<std::string> ret;
    ret.reserve(entries_[0].size() + entries_[1].size());
    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
      for (auto it = entries_[i].begin(); it != entries_[i].end(); ++it)
        ret.emplace_back(std::string("#") + line_type_symbol(it->type) + "\t" + it->name + "\t" + it->format.str() + "\t" + it->description);
    }
    return ret;
  }
}
