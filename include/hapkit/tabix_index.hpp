/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_TABIX_INDEX_HPP
#define LIBHAPKIT_TABIX_INDEX_HPP

#include "index.hpp"

#include <htslib/tbx.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hapkit
{
  /**
   * Tabix (.tbi) index over column 2 as sequence name and columns 3 and 4 as
   * 1-based closed coordinates, equivalent to "tabix -s 2 -b 3 -e 4".
   */
  class tabix_index : public index_service
  {
  public:
    tabix_index() {}

    void build(const std::string& file_path);
    std::unique_ptr<line_cursor> query(const std::string& file_path, const genomic_region& reg) const;
    bool index_exists(const std::string& file_path) const;
    std::string index_path(const std::string& file_path) const { return file_path + ".tbi"; }

    static tbx_conf_t config();
  private:
    std::shared_ptr<tbx_t> load(const std::string& file_path) const;

    mutable std::mutex mtx_;
    mutable std::unordered_map<std::string, std::shared_ptr<tbx_t>> loaded_;
  };
}

#endif // LIBHAPKIT_TABIX_INDEX_HPP
