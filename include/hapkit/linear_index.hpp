/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_LINEAR_INDEX_HPP
#define LIBHAPKIT_LINEAR_INDEX_HPP

#include "index.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hapkit
{
  /**
   * Block checkpoint index (.hpi). Data lines are grouped into blocks of at
   * most records_per_block lines sharing column 2, and each block records
   * its BGZF virtual offset and coordinate bounds.
   *
   * File layout (big-endian):
   *   "hpi\x01"
   *   u32 contig count
   *   per contig: u32 name size, name, u64 checkpoint count,
   *               per checkpoint: u64 min start, u64 max end, u64 virtual offset, u64 record count
   */
  class linear_index : public index_service
  {
  public:
    struct options
    {
      std::size_t records_per_block;
      options() :
        records_per_block(1024)
      {
      }
    };

    struct checkpoint
    {
      std::uint64_t min_start;
      std::uint64_t max_end;
      std::uint64_t virtual_offset;
      std::uint64_t record_count;
    };

    /// Contigs in file order.
    typedef std::vector<std::pair<std::string, std::vector<checkpoint>>> contig_table;

    static const char magic[4];

    linear_index(options opts = options()) : opts_(opts) {}

    void build(const std::string& file_path);
    std::unique_ptr<line_cursor> query(const std::string& file_path, const genomic_region& reg) const;
    bool index_exists(const std::string& file_path) const;
    std::string index_path(const std::string& file_path) const { return file_path + ".hpi"; }

    /**
     * @throws io_error if the index cannot be read or is not an .hpi file
     */
    static contig_table read_index(const std::string& index_file_path);
    static void write_index(const std::string& index_file_path, const contig_table& table);
  private:
    std::shared_ptr<const contig_table> load(const std::string& file_path) const;

    options opts_;
    mutable std::mutex mtx_;
    mutable std::unordered_map<std::string, std::shared_ptr<const contig_table>> loaded_;
  };
}

#endif // LIBHAPKIT_LINEAR_INDEX_HPP
