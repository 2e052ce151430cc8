/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/writer.hpp"
#include "hapkit/codec.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/utility.hpp"

#include <shrinkwrap/gz.hpp>

#include <exception>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace hapkit
{
  namespace
  {
    compression_type resolve_compression(const std::string& file_path, compression_type c)
    {
      if (c != compression_type::infer)
        return c;
      if (detail::has_extension(file_path, ".gz") || detail::has_extension(file_path, ".bgz"))
        return compression_type::bgzf;
      return compression_type::none;
    }
  }

  std::unique_ptr<std::streambuf> writer::create_out_streambuf(const std::string& file_path, compression_type compression)
  {
    if (compression == compression_type::bgzf)
      return std::unique_ptr<std::streambuf>(new shrinkwrap::bgzf::obuf(file_path));

    std::unique_ptr<std::filebuf> ret(new std::filebuf());
    if (!ret->open(file_path.c_str(), std::ios::binary | std::ios::out))
      throw io_error("could not open file for writing", file_path);
    return std::unique_ptr<std::streambuf>(ret.release());
  }

  writer::writer(const std::string& file_path, const header& hdr, options opts) :
    file_path_(file_path),
    opts_(opts),
    compression_(resolve_compression(file_path, opts.compression)),
    header_(hdr),
    output_buf_(create_out_streambuf(file_path, compression_)),
    ofs_(output_buf_.get()),
    validator_(opts.require_sorted || opts.create_index ? validator::mode::streaming : validator::mode::deferred)
  {
    if (!detail::file_exists(file_path))
      throw io_error("could not open file for writing", file_path);

    if (opts_.create_index)
    {
      opts_.require_sorted = true;
      if (compression_ != compression_type::bgzf)
        throw std::invalid_argument("index requires BGZF compression: " + file_path);
      if (!opts_.index)
        opts_.index = default_index_service();
    }

    if (opts_.require_sorted)
      sort_checker_ = detail::make_unique<sort_checker>();

    header_.write(ofs_);
    line_number_ = header_.comments().size() + header_.schema().fields_for(line_type::haplotype).size() + header_.schema().fields_for(line_type::variant).size();

    if (!ofs_.good())
      throw io_error("could not write header", file_path);
  }

  writer::~writer()
  {
    try
    {
      // A file abandoned by an exception is neither validated nor indexed.
      close_impl(!std::uncaught_exception());
    }
    catch (const std::exception& e)
    {
      logger::log(log_level::error, "%s", e.what());
    }
  }

  template <typename T>
  writer& writer::write_record(const T& rec)
  {
    if (!good())
      return *this;

    line_buf_.clear();
    codec::serialize(rec, header_.schema(), line_buf_);

    // Checks run before any state changes so a rejected record can be skipped.
    const std::size_t line_number = line_number_ + 1;
    validator_.check(rec, line_number);
    if (sort_checker_)
      sort_checker_->check(rec, line_number, line_buf_);

    // Unsorted output resolves variant references in close().
    validator_.add(rec, line_number);

    line_buf_ += '\n';
    ofs_.write(line_buf_.data(), line_buf_.size());
    line_number_ = line_number;
    return *this;
  }

  writer& writer::write(const haplotype& h)
  {
    return write_record(h);
  }

  writer& writer::write(const variant& v)
  {
    return write_record(v);
  }

  writer& writer::write(const record& r)
  {
    if (r.is_haplotype())
      return write_record(r.hap());
    return write_record(r.var());
  }

  writer& writer::write_grouped(const std::vector<haplotype>& haplotypes, const std::vector<variant>& variants)
  {
    std::unordered_map<std::string, std::vector<const variant*>> groups;
    for (auto it = haplotypes.begin(); it != haplotypes.end(); ++it)
      groups[it->id()];

    std::vector<dangling_variant_error::reference> dangling;
    for (auto it = variants.begin(); it != variants.end(); ++it)
    {
      auto res = groups.find(it->haplotype_id());
      if (res == groups.end())
        dangling.push_back(dangling_variant_error::reference{it->id(), it->haplotype_id(), 0});
      else
        res->second.push_back(&(*it));
    }

    if (!dangling.empty())
      throw dangling_variant_error(std::move(dangling));

    for (auto it = haplotypes.begin(); it != haplotypes.end() && good(); ++it)
    {
      write(*it);
      const std::vector<const variant*>& vars = groups[it->id()];
      for (auto jt = vars.begin(); jt != vars.end(); ++jt)
        write(**jt);
    }

    return *this;
  }

  void writer::close()
  {
    close_impl(true);
  }

  void writer::close_impl(bool complete)
  {
    if (closed_)
      return;
    closed_ = true;

    ofs_.flush();
    bool ok = ofs_.good();
    ofs_.rdbuf(nullptr);
    output_buf_.reset();

    if (!ok)
      throw io_error("failed to write file", file_path_);

    logger::log(log_level::debug, "closed %s after %zu lines", file_path_.c_str(), line_number_);

    if (!complete)
      return;

    validator_.finish();
    if (opts_.create_index)
      opts_.index->build(file_path_);
  }
}
