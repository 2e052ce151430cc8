/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_RECORD_SET_HPP
#define LIBHAPKIT_RECORD_SET_HPP

#include "header.hpp"
#include "index.hpp"
#include "record.hpp"
#include "region.hpp"
#include "writer.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hapkit
{
  /**
   * In-memory contents of a file: header plus haplotypes in insertion order,
   * each owning its variants.
   */
  class record_set
  {
  public:
    record_set() {}
    explicit record_set(header hdr) : header_(std::move(hdr)) {}

    /**
     * Loads a whole file. Variants may precede their haplotype.
     * @throws dangling_variant_error listing every unresolved variant
     */
    static record_set read(const std::string& file_path);

    /**
     * Loads haplotypes overlapping a region, optionally restricted to the
     * given IDs, along with all of their variants. Needs an indexed file.
     */
    static record_set read(const std::string& file_path, const genomic_region& reg, const std::vector<std::string>& haplotype_ids = {}, std::shared_ptr<index_service> service = default_index_service());

    /**
     * Loads the given haplotypes. H lines are found by scanning; variants
     * are fetched from the index.
     */
    static record_set read(const std::string& file_path, const std::vector<std::string>& haplotype_ids, std::shared_ptr<index_service> service = default_index_service());

    /**
     * @throws duplicate_haplotype_error
     */
    void add(haplotype h);

    /**
     * @throws dangling_variant_error if the haplotype has not been added
     */
    void add(variant v);

    /**
     * @return nullptr if no haplotype has this ID
     */
    const haplotype* find(const std::string& haplotype_id) const;

    const std::vector<haplotype>& haplotypes() const { return haplotypes_; }

    /**
     * @return Variants in insertion order (empty for unknown IDs)
     */
    const std::vector<variant>& variants_of(const std::string& haplotype_id) const;

    std::size_t size() const { return haplotypes_.size(); }
    std::size_t variant_count() const;
    bool empty() const { return haplotypes_.empty(); }

    const ::hapkit::header& file_header() const { return header_; }
    const ::hapkit::schema& schema() const { return header_.schema(); }

    /**
     * Reorders haplotypes by (chromosome, start, end) and each haplotype's
     * variants by (start, end). Ties keep insertion order.
     */
    void sort();

    /**
     * Writes each haplotype followed by its variants. With require_sorted
     * (or create_index) all H lines are written first, then V lines grouped
     * by haplotype ID in byte order.
     */
    void write(const std::string& file_path, writer::options opts = writer::options()) const;
  private:
    header header_;
    std::vector<haplotype> haplotypes_;
    std::vector<std::vector<variant>> variants_;
    std::unordered_map<std::string, std::size_t> id_to_idx_;
  };

  /**
   * Compares headers, haplotypes and variants in order using equivalent().
   */
  bool equivalent(const record_set& a, const record_set& b);
}

#endif // LIBHAPKIT_RECORD_SET_HPP
