/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_READER_HPP
#define LIBHAPKIT_READER_HPP

#include "header.hpp"
#include "index.hpp"
#include "record.hpp"
#include "region.hpp"
#include "validator.hpp"

#include <cstdint>
#include <ios>
#include <istream>
#include <memory>
#include <string>

namespace hapkit
{
  /**
   * Streams records of a plain or gzip/BGZF compressed file in file order.
   *
   * Format errors are thrown as exceptions derived from format_error. Stream
   * state works like std::istream: the reader is good until the end of the
   * file or an I/O failure.
   */
  class reader
  {
  public:
    enum class validation_mode
    {
      none,
      streaming, ///< Sorted input; variants must follow their haplotype
      deferred ///< Any order; unresolved variants reported at end of stream
    };

    struct options
    {
      validation_mode validation;
      options() :
        validation(validation_mode::none)
      {
      }
    };

    /**
     * Opens file and parses its header.
     * @throws io_error if the file cannot be opened
     */
    reader(const std::string& file_path, options opts = options());

    /**
     * Reads next record. Reaching the end of the file sets eof() and, in
     * deferred mode, calls finish().
     * @param r Destination record
     * @return *this
     */
    reader& read(record& r);
    reader& operator>>(record& r) { return read(r); }

    /**
     * Resolves buffered variants in deferred mode. No-op otherwise.
     * @throws dangling_variant_error
     */
    void finish();

    const header& file_header() const { return header_; }
    const ::hapkit::schema& schema() const { return header_.schema(); }
    std::shared_ptr<const ::hapkit::schema> shared_schema() const { return header_.shared_schema(); }
    const std::string& file_path() const { return file_path_; }

    /// Number of lines consumed so far, including header lines.
    std::size_t line_number() const { return line_number_; }

    bool good() const { return state_ == std::ios::goodbit; }
    bool bad() const { return (state_ & std::ios::badbit) != 0; }
    bool eof() const { return (state_ & std::ios::eofbit) != 0; }
    operator bool() const { return good(); }
  private:
    std::string file_path_;
    options opts_;
    std::unique_ptr<std::istream> input_stream_;
    std::ios::iostate state_ = std::ios::goodbit;
    header header_;
    std::size_t line_number_ = 0;
    std::unique_ptr<validator> validator_;
    std::unique_ptr<sort_checker> sort_checker_;
    bool finished_ = false;
    std::string line_buf_;
  };

  /**
   * Random access to records whose column 2 matches a region's contig and
   * whose [start, end] intersects the region, in file order. Requires a
   * sorted BGZF file with an index built by the given service.
   */
  class indexed_reader
  {
  public:
    /**
     * @throws io_error if the file cannot be opened or the index is missing
     */
    indexed_reader(const std::string& file_path, const genomic_region& reg, std::shared_ptr<index_service> service = default_index_service());

    /**
     * Starts a new query on the same file.
     */
    indexed_reader& reset_bounds(const genomic_region& reg);

    /**
     * Reads next overlapping record.
     * @throws unsorted_file_error if start positions decrease within the contig
     */
    indexed_reader& read(record& r);
    indexed_reader& operator>>(record& r) { return read(r); }

    const header& file_header() const { return header_; }
    const ::hapkit::schema& schema() const { return header_.schema(); }
    std::shared_ptr<const ::hapkit::schema> shared_schema() const { return header_.shared_schema(); }
    const genomic_region& region() const { return region_; }
    const std::string& file_path() const { return file_path_; }

    bool good() const { return state_ == std::ios::goodbit; }
    bool bad() const { return (state_ & std::ios::badbit) != 0; }
    bool eof() const { return (state_ & std::ios::eofbit) != 0; }
    operator bool() const { return good(); }
  private:
    std::string file_path_;
    std::shared_ptr<index_service> service_;
    header header_;
    genomic_region region_;
    std::unique_ptr<line_cursor> cursor_;
    std::ios::iostate state_ = std::ios::goodbit;
    bool has_previous_ = false;
    std::uint64_t prev_start_ = 0;
    std::string line_buf_;
  };
}

#endif // LIBHAPKIT_READER_HPP
