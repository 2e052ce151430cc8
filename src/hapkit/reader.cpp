/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/reader.hpp"
#include "hapkit/codec.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/utility.hpp"

#include <shrinkwrap/istream.hpp>

namespace hapkit
{
  reader::reader(const std::string& file_path, options opts) :
    file_path_(file_path),
    opts_(opts)
  {
    if (!detail::file_exists(file_path))
      throw io_error("could not open file", file_path);

    input_stream_ = detail::make_unique<shrinkwrap::istream>(file_path);
    if (!input_stream_->good())
      throw io_error("could not open file", file_path);

    header_ = header::parse(*input_stream_, line_number_);

    switch (opts_.validation)
    {
    case validation_mode::streaming:
      validator_ = detail::make_unique<validator>(validator::mode::streaming);
      sort_checker_ = detail::make_unique<sort_checker>();
      break;
    case validation_mode::deferred:
      validator_ = detail::make_unique<validator>(validator::mode::deferred);
      break;
    case validation_mode::none:
      break;
    }

    logger::log(log_level::debug, "opened %s (%zu header lines)", file_path.c_str(), line_number_);
  }

  reader& reader::read(record& r)
  {
    if (!good())
      return *this;

    if (!std::getline(*input_stream_, line_buf_))
    {
      if (input_stream_->bad() || !input_stream_->eof())
      {
        state_ |= std::ios::badbit | std::ios::failbit;
        return *this;
      }

      state_ |= std::ios::eofbit | std::ios::failbit;
      finish();
      return *this;
    }

    ++line_number_;
    codec::parse(line_buf_, header_.schema(), r, line_number_);

    if (sort_checker_)
      sort_checker_->check(r, line_number_, line_buf_);
    if (validator_)
      validator_->add(r, line_number_);

    return *this;
  }

  void reader::finish()
  {
    if (finished_)
      return;
    finished_ = true;

    if (validator_)
      validator_->finish();
  }

  indexed_reader::indexed_reader(const std::string& file_path, const genomic_region& reg, std::shared_ptr<index_service> service) :
    file_path_(file_path),
    service_(std::move(service)),
    region_(reg)
  {
    if (!detail::file_exists(file_path))
      throw io_error("could not open file", file_path);

    shrinkwrap::istream input(file_path);
    if (!input.good())
      throw io_error("could not open file", file_path);

    std::size_t lines_read = 0;
    header_ = header::parse(input, lines_read);

    if (!service_->index_exists(file_path))
      throw io_error("index not found", service_->index_path(file_path));

    reset_bounds(reg);
  }

  indexed_reader& indexed_reader::reset_bounds(const genomic_region& reg)
  {
    region_ = reg;
    has_previous_ = false;
    prev_start_ = 0;
    cursor_.reset();
    state_ = std::ios::goodbit;

    cursor_ = service_->query(file_path_, region_);
    logger::log(log_level::debug, "query %s:%llu-%llu on %s", region_.chromosome().c_str(), (unsigned long long)region_.from(), (unsigned long long)region_.to(), file_path_.c_str());
    return *this;
  }

  indexed_reader& indexed_reader::read(record& r)
  {
    while (good())
    {
      if (!cursor_->next(line_buf_))
      {
        state_ |= std::ios::eofbit;
        break;
      }

      codec::parse(line_buf_, header_.schema(), r);

      if (r.contig() != region_.chromosome())
      {
        state_ |= std::ios::eofbit;
        break;
      }

      if (has_previous_ && r.start() < prev_start_)
        throw unsorted_file_error("start positions decrease within " + region_.chromosome() + " in " + file_path_ + ": " + line_buf_);
      has_previous_ = true;
      prev_start_ = r.start();

      if (r.start() > region_.to())
      {
        state_ |= std::ios::eofbit;
        break;
      }

      if (region_overlaps(r.start(), r.end(), region_))
        return *this;
    }

    return *this;
  }
}
