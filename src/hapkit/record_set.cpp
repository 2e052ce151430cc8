/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/record_set.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/reader.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <tuple>
#include <unordered_set>

namespace hapkit
{
  record_set record_set::read(const std::string& file_path)
  {
    reader::options opts;
    opts.validation = reader::validation_mode::deferred;
    reader rdr(file_path, opts);

    std::vector<haplotype> haps;
    std::vector<variant> vars;
    record rec;
    while (rdr.read(rec))
    {
      if (rec.is_haplotype())
        haps.emplace_back(std::move(rec.hap()));
      else
        vars.emplace_back(std::move(rec.var()));
    }

    if (rdr.bad())
      throw io_error("read failure", file_path);

    record_set ret(rdr.file_header());
    for (auto it = haps.begin(); it != haps.end(); ++it)
      ret.add(std::move(*it));
    for (auto it = vars.begin(); it != vars.end(); ++it)
      ret.add(std::move(*it));

    logger::log(log_level::info, "loaded %zu haplotypes and %zu variants from %s", ret.size(), vars.size(), file_path.c_str());
    return ret;
  }

  namespace
  {
    void load_variants(indexed_reader& rdr, record_set& dest)
    {
      std::vector<std::string> ids;
      ids.reserve(dest.size());
      for (auto it = dest.haplotypes().begin(); it != dest.haplotypes().end(); ++it)
        ids.push_back(it->id());

      record rec;
      for (auto it = ids.begin(); it != ids.end(); ++it)
      {
        rdr.reset_bounds(genomic_region(*it));
        while (rdr.read(rec))
        {
          if (rec.is_variant())
            dest.add(std::move(rec.var()));
        }

        if (rdr.bad())
          throw io_error("read failure", rdr.file_path());
      }
    }
  }

  record_set record_set::read(const std::string& file_path, const genomic_region& reg, const std::vector<std::string>& haplotype_ids, std::shared_ptr<index_service> service)
  {
    indexed_reader rdr(file_path, reg, std::move(service));
    std::unordered_set<std::string> wanted(haplotype_ids.begin(), haplotype_ids.end());

    record_set ret(rdr.file_header());
    record rec;
    while (rdr.read(rec))
    {
      if (rec.is_haplotype() && (wanted.empty() || wanted.count(rec.hap().id())))
        ret.add(std::move(rec.hap()));
    }

    if (rdr.bad())
      throw io_error("read failure", file_path);

    load_variants(rdr, ret);

    logger::log(log_level::info, "loaded %zu haplotypes in %s from %s", ret.size(), reg.chromosome().c_str(), file_path.c_str());
    return ret;
  }

  record_set record_set::read(const std::string& file_path, const std::vector<std::string>& haplotype_ids, std::shared_ptr<index_service> service)
  {
    if (haplotype_ids.empty())
      return read(file_path);

    std::unordered_set<std::string> wanted(haplotype_ids.begin(), haplotype_ids.end());

    reader scan(file_path);
    record_set ret(scan.file_header());
    record rec;
    // H lines precede V lines in an indexed file.
    while (scan.read(rec) && rec.is_haplotype())
    {
      if (wanted.count(rec.hap().id()))
        ret.add(std::move(rec.hap()));
    }

    if (scan.bad())
      throw io_error("read failure", file_path);

    if (ret.size() < wanted.size())
      logger::log(log_level::warning, "%zu of %zu requested haplotypes not found in %s", wanted.size() - ret.size(), wanted.size(), file_path.c_str());

    if (!ret.empty())
    {
      indexed_reader rdr(file_path, genomic_region(ret.haplotypes().front().id()), std::move(service));
      load_variants(rdr, ret);
    }

    return ret;
  }

  void record_set::add(haplotype h)
  {
    if (!id_to_idx_.insert(std::make_pair(h.id(), haplotypes_.size())).second)
      throw duplicate_haplotype_error("duplicate haplotype ID " + h.id());

    haplotypes_.emplace_back(std::move(h));
    variants_.emplace_back();
  }

  void record_set::add(variant v)
  {
    auto res = id_to_idx_.find(v.haplotype_id());
    if (res == id_to_idx_.end())
      throw dangling_variant_error(std::vector<dangling_variant_error::reference>(1, dangling_variant_error::reference{v.id(), v.haplotype_id(), 0}));

    variants_[res->second].emplace_back(std::move(v));
  }

  const haplotype* record_set::find(const std::string& haplotype_id) const
  {
    auto res = id_to_idx_.find(haplotype_id);
    return res == id_to_idx_.end() ? nullptr : &haplotypes_[res->second];
  }

  const std::vector<variant>& record_set::variants_of(const std::string& haplotype_id) const
  {
    static const std::vector<variant> none;
    auto res = id_to_idx_.find(haplotype_id);
    return res == id_to_idx_.end() ? none : variants_[res->second];
  }

  std::size_t record_set::variant_count() const
  {
    std::size_t ret = 0;
    for (auto it = variants_.begin(); it != variants_.end(); ++it)
      ret += it->size();
    return ret;
  }

  void record_set::sort()
  {
    std::vector<std::size_t> order(haplotypes_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b)
    {
      const haplotype& l = haplotypes_[a];
      const haplotype& r = haplotypes_[b];
      return std::make_tuple(std::cref(l.chrom()), l.start(), l.end()) < std::make_tuple(std::cref(r.chrom()), r.start(), r.end());
    });

    std::vector<haplotype> haps;
    std::vector<std::vector<variant>> vars;
    haps.reserve(order.size());
    vars.reserve(order.size());
    id_to_idx_.clear();
    for (auto it = order.begin(); it != order.end(); ++it)
    {
      id_to_idx_[haplotypes_[*it].id()] = haps.size();
      haps.emplace_back(std::move(haplotypes_[*it]));
      vars.emplace_back(std::move(variants_[*it]));
      std::stable_sort(vars.back().begin(), vars.back().end(), [](const variant& l, const variant& r)
      {
        return std::make_pair(l.start(), l.end()) < std::make_pair(r.start(), r.end());
      });
    }

    haplotypes_ = std::move(haps);
    variants_ = std::move(vars);
  }

  void record_set::write(const std::string& file_path, writer::options opts) const
  {
    writer out(file_path, header_, opts);

    if (opts.require_sorted || opts.create_index)
    {
      for (auto it = haplotypes_.begin(); it != haplotypes_.end(); ++it)
        out.write(*it);

      std::map<std::string, std::size_t> by_id(id_to_idx_.begin(), id_to_idx_.end());
      for (auto it = by_id.begin(); it != by_id.end(); ++it)
      {
        const std::vector<variant>& vars = variants_[it->second];
        for (auto jt = vars.begin(); jt != vars.end(); ++jt)
          out.write(*jt);
      }
    }
    else
    {
      for (std::size_t i = 0; i < haplotypes_.size(); ++i)
      {
        out.write(haplotypes_[i]);
        for (auto jt = variants_[i].begin(); jt != variants_[i].end(); ++jt)
          out.write(*jt);
      }
    }

    out.close();
  }

  bool equivalent(const record_set& a, const record_set& b)
  {
    if (a.schema() != b.schema() || a.file_header().comments() != b.file_header().comments())
      return false;

    if (a.size() != b.size())
      return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
      const haplotype& ha = a.haplotypes()[i];
      const haplotype& hb = b.haplotypes()[i];
      if (!equivalent(ha, hb, a.schema()))
        return false;

      const std::vector<variant>& va = a.variants_of(ha.id());
      const std::vector<variant>& vb = b.variants_of(hb.id());
      if (va.size() != vb.size())
        return false;
      for (std::size_t j = 0; j < va.size(); ++j)
      {
        if (!equivalent(va[j], vb[j], a.schema()))
          return false;
      }
    }

    return true;
  }
}
