/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/codec.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/utility.hpp"

namespace hapkit
{
  const std::size_t codec::haplotype_mandatory_columns;
  const std::size_t codec::variant_mandatory_columns;

  line_type codec::detect(const std::string& line, std::size_t line_number)
  {
    if (line.size() >= 2 && line[1] == '\t')
    {
      if (line[0] == 'H')
        return line_type::haplotype;
      if (line[0] == 'V')
        return line_type::variant;
    }

    if (line.empty())
      throw malformed_line_error("empty line", line_number);
    if (line[0] == '#')
      throw malformed_line_error("header line after data", line_number);

    throw malformed_line_error("unknown line type '" + line.substr(0, line.find('\t')) + "'", line_number);
  }

  std::vector<std::string> codec::split_columns(const std::string& line, line_type type, const schema& s, std::size_t line_number)
  {
    std::vector<std::string> cols = detail::split_string_to_vector(line, '\t');

    const std::size_t mandatory = 1 + (type == line_type::haplotype ? haplotype_mandatory_columns : variant_mandatory_columns);
    const std::size_t expected = mandatory + s.fields_for(type).size();

    if (cols.size() < mandatory)
      throw malformed_line_error(std::string(1, line_type_symbol(type)) + " line must have at least " + std::to_string(mandatory) + " columns, found " + std::to_string(cols.size()), line_number);

    if (cols.size() < expected)
      throw malformed_line_error(std::string(1, line_type_symbol(type)) + " line must have " + std::to_string(expected) + " columns, found " + std::to_string(cols.size()), line_number);

    if (cols.size() > expected)
      throw undeclared_field_error(std::string(1, line_type_symbol(type)) + " line has " + std::to_string(cols.size() - expected) + " undeclared extra column(s)", line_number);

    for (std::size_t i = 1; i < mandatory; ++i)
    {
      if (cols[i].empty())
        throw malformed_line_error("empty mandatory column " + std::to_string(i + 1), line_number);
    }

    return cols;
  }

  std::uint64_t codec::parse_position(const std::string& col, const char* name, std::size_t line_number)
  {
    std::uint64_t ret = 0;
    if (!detail::parse_uint64(col, ret))
      throw malformed_line_error(std::string("invalid ") + name + " position '" + col + "'", line_number);
    return ret;
  }

  void codec::parse_extra(const std::vector<std::string>& cols, std::size_t offset, line_type type, const schema& s, extra_field_list& dest, std::size_t line_number)
  {
    const std::vector<field_declaration>& decls = s.fields_for(type);
    dest.clear();
    dest.reserve(decls.size());
    for (std::size_t i = 0; i < decls.size(); ++i)
      dest.emplace_back(decls[i].name, typed_value::parse(cols[offset + i], decls[i].format, decls[i].name, line_number));
  }

  haplotype codec::parse_haplotype(const std::string& line, const schema& s, std::size_t line_number)
  {
    if (detect(line, line_number) != line_type::haplotype)
      throw malformed_line_error("expected H line", line_number);

    std::vector<std::string> cols = split_columns(line, line_type::haplotype, s, line_number);

    haplotype ret;
    ret.chrom_ = std::move(cols[1]);
    ret.start_ = parse_position(cols[2], "start", line_number);
    ret.end_ = parse_position(cols[3], "end", line_number);
    ret.id_ = std::move(cols[4]);

    if (ret.end_ < ret.start_)
      throw malformed_line_error("end position is less than start position", line_number);

    parse_extra(cols, 1 + haplotype_mandatory_columns, line_type::haplotype, s, ret.extra_, line_number);
    return ret;
  }

  variant codec::parse_variant(const std::string& line, const schema& s, std::size_t line_number)
  {
    if (detect(line, line_number) != line_type::variant)
      throw malformed_line_error("expected V line", line_number);

    std::vector<std::string> cols = split_columns(line, line_type::variant, s, line_number);

    variant ret;
    ret.hap_id_ = std::move(cols[1]);
    ret.start_ = parse_position(cols[2], "start", line_number);
    ret.end_ = parse_position(cols[3], "end", line_number);
    ret.id_ = std::move(cols[4]);
    ret.allele_ = std::move(cols[5]);

    if (ret.end_ < ret.start_)
      throw malformed_line_error("end position is less than start position", line_number);

    parse_extra(cols, 1 + variant_mandatory_columns, line_type::variant, s, ret.extra_, line_number);
    return ret;
  }

  void codec::parse(const std::string& line, const schema& s, record& dest, std::size_t line_number)
  {
    dest.type_ = detect(line, line_number);
    if (dest.type_ == line_type::haplotype)
      dest.hap_ = parse_haplotype(line, s, line_number);
    else
      dest.var_ = parse_variant(line, s, line_number);
  }

  void codec::append_text_column(const std::string& val, const char* name, std::string& dest)
  {
    if (val.empty())
      throw malformed_line_error(std::string("empty ") + name);
    if (val.find_first_of("\t\n") != std::string::npos)
      throw malformed_line_error(std::string(name) + " contains a tab or newline: " + val);
    dest += '\t';
    dest += val;
  }

  void codec::append_extra(const extra_fields& rec, line_type type, const schema& s, std::string& dest)
  {
    const std::vector<field_declaration>& decls = s.fields_for(type);

    for (auto it = rec.extra().begin(); it != rec.extra().end(); ++it)
    {
      if (s.field_index(type, it->first) < 0)
        throw undeclared_field_error(std::string("field ") + it->first + " is not declared for " + line_type_symbol(type) + " lines");
    }

    for (auto it = decls.begin(); it != decls.end(); ++it)
    {
      const typed_value* val = rec.find_extra(it->name);
      if (!val || val->empty())
        throw type_coercion_error("missing value for field " + it->name);

      std::string text = val->format(it->format, it->name);
      if (text.find_first_of("\t\n") != std::string::npos)
        throw malformed_line_error("value of field " + it->name + " contains a tab or newline");
      dest += '\t';
      dest += text;
    }
  }

  void codec::serialize(const haplotype& h, const schema& s, std::string& dest)
  {
    if (h.end() < h.start())
      throw malformed_line_error("haplotype " + h.id() + " ends before it starts");

    dest += 'H';
    append_text_column(h.chrom(), "chromosome", dest);
    dest += '\t';
    dest += std::to_string(h.start());
    dest += '\t';
    dest += std::to_string(h.end());
    append_text_column(h.id(), "haplotype ID", dest);
    append_extra(h, line_type::haplotype, s, dest);
  }

  void codec::serialize(const variant& v, const schema& s, std::string& dest)
  {
    if (v.end() < v.start())
      throw malformed_line_error("variant " + v.id() + " ends before it starts");

    dest += 'V';
    append_text_column(v.haplotype_id(), "haplotype ID", dest);
    dest += '\t';
    dest += std::to_string(v.start());
    dest += '\t';
    dest += std::to_string(v.end());
    append_text_column(v.id(), "variant ID", dest);
    append_text_column(v.allele(), "allele", dest);
    append_extra(v, line_type::variant, s, dest);
  }

  void codec::serialize(const record& r, const schema& s, std::string& dest)
  {
    if (r.is_haplotype())
      serialize(r.hap(), s, dest);
    else
      serialize(r.var(), s, dest);
  }
}
