/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_INDEX_HPP
#define LIBHAPKIT_INDEX_HPP

#include "region.hpp"

#include <memory>
#include <string>

namespace hapkit
{
  /**
   * Forward-only sequence of decompressed data lines produced by an index
   * query. Lines may precede or follow the queried interval; callers filter.
   */
  class line_cursor
  {
  public:
    virtual ~line_cursor() {}

    /**
     * Reads next candidate line (without newline).
     * @return False when the query is exhausted
     * @throws io_error on read failure
     */
    virtual bool next(std::string& line) = 0;
  };

  /**
   * Builds and queries random-access indexes of sorted BGZF files.
   * Implementations are safe to query concurrently; each query owns its own
   * file handle.
   */
  class index_service
  {
  public:
    virtual ~index_service() {}

    /**
     * Checks that the file is sorted, then writes the index beside it.
     * @throws unsorted_file_error, io_error
     */
    virtual void build(const std::string& file_path) = 0;

    /**
     * @throws io_error if the file or its index cannot be opened
     */
    virtual std::unique_ptr<line_cursor> query(const std::string& file_path, const genomic_region& reg) const = 0;

    virtual bool index_exists(const std::string& file_path) const = 0;
    virtual std::string index_path(const std::string& file_path) const = 0;
  };

  /// Tabix service used when none is given.
  std::shared_ptr<index_service> default_index_service();

  namespace detail
  {
    /**
     * Streams a whole file through the sort checker.
     * @return Number of data lines
     * @throws unsorted_file_error, format_error, io_error
     */
    std::size_t check_sorted(const std::string& file_path);
  }
}

#endif // LIBHAPKIT_INDEX_HPP
