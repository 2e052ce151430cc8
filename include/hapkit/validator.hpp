/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_VALIDATOR_HPP
#define LIBHAPKIT_VALIDATOR_HPP

#include "record.hpp"
#include "errors.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace hapkit
{
  /**
   * Checks haplotype ID uniqueness and that every variant references a
   * known haplotype.
   */
  class validator
  {
  public:
    enum class mode
    {
      deferred, ///< Unresolved variants are reported together by finish()
      streaming ///< Variant must follow its haplotype
    };

    validator(mode m = mode::deferred) : mode_(m) {}

    /**
     * @throws duplicate_haplotype_error if the ID was already added
     */
    void add(const haplotype& h, std::size_t line_number = 0);

    /**
     * @throws dangling_variant_error in streaming mode if the haplotype is unknown
     */
    void add(const variant& v, std::size_t line_number = 0);

    void add(const record& r, std::size_t line_number = 0);

    /**
     * Throws the error add() would throw without recording anything.
     */
    void check(const haplotype& h, std::size_t line_number = 0) const;
    void check(const variant& v, std::size_t line_number = 0) const;

    /**
     * Resolves buffered variants against every haplotype added so far.
     * @throws dangling_variant_error listing all unresolved references in input order
     */
    void finish();

    bool contains(const std::string& haplotype_id) const { return hap_ids_.find(haplotype_id) != hap_ids_.end(); }
    mode validation_mode() const { return mode_; }
    std::size_t haplotype_count() const { return hap_ids_.size(); }
  private:
    mode mode_;
    std::unordered_set<std::string> hap_ids_;
    std::vector<dangling_variant_error::reference> pending_;
  };

  /**
   * Enforces the order required for indexing: each line's key
   * (symbol, column 2, start, end) must not be less than the previous one.
   * Column 2 is compared bytewise and positions numerically.
   */
  class sort_checker
  {
  public:
    sort_checker() {}

    /**
     * @param type Line type
     * @param contig Column 2
     * @param start Column 3
     * @param end Column 4
     * @param line_number 1-based line number
     * @param line Line content for the error message (optional)
     * @throws unsorted_file_error
     */
    void check(line_type type, const std::string& contig, std::uint64_t start, std::uint64_t end, std::size_t line_number = 0, const std::string& line = "");

    /**
     * Also rejects a haplotype ID that equals a chromosome name, in either order.
     * @throws unsorted_file_error
     */
    void check(const haplotype& h, std::size_t line_number = 0, const std::string& line = "");
    void check(const variant& v, std::size_t line_number = 0, const std::string& line = "");
    void check(const record& r, std::size_t line_number = 0, const std::string& line = "");

    void reset();
  private:
    bool has_previous_ = false;
    line_type prev_type_ = line_type::haplotype;
    std::string prev_contig_;
    std::uint64_t prev_start_ = 0;
    std::uint64_t prev_end_ = 0;
    std::unordered_set<std::string> chromosomes_;
    std::unordered_set<std::string> hap_ids_;
  };
}

#endif // LIBHAPKIT_VALIDATOR_HPP
