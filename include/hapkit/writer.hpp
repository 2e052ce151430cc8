/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_WRITER_HPP
#define LIBHAPKIT_WRITER_HPP

#include "header.hpp"
#include "index.hpp"
#include "record.hpp"
#include "validator.hpp"

#include <memory>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace hapkit
{
  enum class compression_type
  {
    infer = 0, ///< BGZF if the path ends with .gz or .bgz
    none,
    bgzf
  };

  /**
   * Writes a header followed by records in the order they are given.
   * The writer never reorders records.
   */
  class writer
  {
  public:
    struct options
    {
      compression_type compression;
      bool require_sorted;
      bool create_index; ///< Implies require_sorted. Index is built by close().
      std::shared_ptr<index_service> index; ///< Defaults to tabix when null.
      options() :
        compression(compression_type::infer),
        require_sorted(false),
        create_index(false)
      {
      }
    };

    /**
     * Opens file and writes the header.
     * @throws io_error if the file cannot be opened
     * @throws std::invalid_argument if an index is requested for an uncompressed file
     */
    writer(const std::string& file_path, const header& hdr, options opts = options());

    /**
     * Calls close(). Errors are logged instead of thrown.
     */
    ~writer();

    writer(const writer&) = delete;
    writer& operator=(const writer&) = delete;

    /**
     * Writes a single record.
     * @throws format_error if the record cannot be serialized, repeats a
     * haplotype ID or, with require_sorted, is out of order
     */
    writer& write(const haplotype& h);
    writer& write(const variant& v);
    writer& write(const record& r);
    writer& operator<<(const haplotype& h) { return write(h); }
    writer& operator<<(const variant& v) { return write(v); }

    /**
     * Writes each haplotype followed by its variants. Variants keep their
     * relative order.
     * @throws dangling_variant_error before writing anything if a variant's haplotype is not in haplotypes
     */
    writer& write_grouped(const std::vector<haplotype>& haplotypes, const std::vector<variant>& variants);

    /**
     * Flushes and closes the file, checks that every variant written
     * references a written haplotype, then builds the index if requested.
     * @throws io_error if the final flush fails
     * @throws dangling_variant_error listing variants of unknown haplotypes
     */
    void close();

    const header& file_header() const { return header_; }
    const std::string& file_path() const { return file_path_; }
    compression_type compression() const { return compression_; }

    bool good() const { return !closed_ && ofs_.good(); }
    operator bool() const { return good(); }
  private:
    static std::unique_ptr<std::streambuf> create_out_streambuf(const std::string& file_path, compression_type compression);

    template <typename T>
    writer& write_record(const T& rec);
    void close_impl(bool complete);

    std::string file_path_;
    options opts_;
    compression_type compression_;
    header header_;
    std::unique_ptr<std::streambuf> output_buf_;
    std::ostream ofs_;
    std::unique_ptr<sort_checker> sort_checker_;
    validator validator_;
    std::size_t line_number_ = 0;
    std::string line_buf_;
    bool closed_ = false;
  };
}

#endif // LIBHAPKIT_WRITER_HPP
