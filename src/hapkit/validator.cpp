/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/validator.hpp"
#include "hapkit/logging.hpp"

#include <tuple>

namespace hapkit
{
  void validator::check(const haplotype& h, std::size_t line_number) const
  {
    if (contains(h.id()))
      throw duplicate_haplotype_error("duplicate haplotype ID " + h.id(), line_number);
  }

  void validator::check(const variant& v, std::size_t line_number) const
  {
    if (mode_ == mode::streaming && !contains(v.haplotype_id()))
      throw dangling_variant_error(std::vector<dangling_variant_error::reference>(1, dangling_variant_error::reference{v.id(), v.haplotype_id(), line_number}));
  }

  void validator::add(const haplotype& h, std::size_t line_number)
  {
    check(h, line_number);
    hap_ids_.insert(h.id());
  }

  void validator::add(const variant& v, std::size_t line_number)
  {
    check(v, line_number);
    if (!contains(v.haplotype_id()))
      pending_.push_back(dangling_variant_error::reference{v.id(), v.haplotype_id(), line_number});
  }

  void validator::add(const record& r, std::size_t line_number)
  {
    if (r.is_haplotype())
      add(r.hap(), line_number);
    else
      add(r.var(), line_number);
  }

  void validator::finish()
  {
    std::vector<dangling_variant_error::reference> unresolved;
    for (auto it = pending_.begin(); it != pending_.end(); ++it)
    {
      if (!contains(it->haplotype_id))
        unresolved.emplace_back(std::move(*it));
    }
    pending_.clear();

    if (!unresolved.empty())
      throw dangling_variant_error(std::move(unresolved));

    logger::log(log_level::debug, "validated %zu haplotypes", hap_ids_.size());
  }

  void sort_checker::check(line_type type, const std::string& contig, std::uint64_t start, std::uint64_t end, std::size_t line_number, const std::string& line)
  {
    if (has_previous_)
    {
      const char prev_symbol = line_type_symbol(prev_type_);
      const char cur_symbol = line_type_symbol(type);
      if (std::tie(cur_symbol, contig, start, end) < std::tie(prev_symbol, prev_contig_, prev_start_, prev_end_))
        throw unsorted_file_error("line is out of order" + (line.empty() ? std::string() : ": " + line), line_number);
    }

    has_previous_ = true;
    prev_type_ = type;
    prev_contig_ = contig;
    prev_start_ = start;
    prev_end_ = end;
  }

  void sort_checker::check(const haplotype& h, std::size_t line_number, const std::string& line)
  {
    if (hap_ids_.find(h.chrom()) != hap_ids_.end() || h.chrom() == h.id())
      throw unsorted_file_error("chromosome " + h.chrom() + " is also used as a haplotype ID", line_number);
    if (chromosomes_.find(h.id()) != chromosomes_.end())
      throw unsorted_file_error("haplotype ID " + h.id() + " is also used as a chromosome", line_number);

    check(line_type::haplotype, h.chrom(), h.start(), h.end(), line_number, line);

    chromosomes_.insert(h.chrom());
    hap_ids_.insert(h.id());
  }

  void sort_checker::check(const variant& v, std::size_t line_number, const std::string& line)
  {
    if (chromosomes_.find(v.haplotype_id()) != chromosomes_.end())
      throw unsorted_file_error("haplotype ID " + v.haplotype_id() + " is also used as a chromosome", line_number);

    check(line_type::variant, v.haplotype_id(), v.start(), v.end(), line_number, line);
  }

  void sort_checker::check(const record& r, std::size_t line_number, const std::string& line)
  {
    if (r.is_haplotype())
      check(r.hap(), line_number, line);
    else
      check(r.var(), line_number, line);
  }

  void sort_checker::reset()
  {
    has_previous_ = false;
    prev_contig_.clear();
    prev_start_ = 0;
    prev_end_ = 0;
    chromosomes_.clear();
    hap_ids_.clear();
  }
}
