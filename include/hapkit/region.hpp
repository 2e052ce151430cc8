/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_REGION_HPP
#define LIBHAPKIT_REGION_HPP

#include <cstdint>
#include <string>
#include <limits>
#include <algorithm>
#include <vector>

namespace hapkit
{
  /**
   * Closed interval on a contig. For queries the contig is matched against
   * column 2, so a haplotype ID selects that haplotype's variants.
   */
  class genomic_region
  {
  public:
    /**
     * Merges regions that share a contig into their bounding interval.
     * @tparam Iter Iterator type
     * @param beg Begin iterator of container
     * @param end End iterator of container
     * @return One region per contig in first-seen order
     */
    template <typename Iter>
    static std::vector<genomic_region> merge(Iter beg, Iter end);

    genomic_region(const std::string& chromosome, std::uint64_t from = 0, std::uint64_t to = std::numeric_limits<std::uint64_t>::max()) :
      chromosome_(chromosome),
      from_(from),
      to_(to)
    {
    }

    /**
     * Gets chromosome (or haplotype ID) for query.
     * @return Contig string
     */
    const std::string& chromosome() const { return chromosome_; }

    /**
     * Gets start position of query.
     * @return Start position
     */
    std::uint64_t from() const { return from_; }

    /**
     * Gets end position of query (inclusive).
     * @return End position
     */
    std::uint64_t to() const { return to_; }
  private:
    std::string chromosome_;
    std::uint64_t from_;
    std::uint64_t to_;
  };

  typedef genomic_region region;

  template <typename Iter>
  std::vector<genomic_region> genomic_region::merge(Iter beg, Iter end)
  {
    std::vector<genomic_region> ret;

    for (auto it = beg; it != end; ++it)
    {
      auto jt = ret.begin();
      for ( ; jt != ret.end(); ++jt)
      {
        if (jt->chromosome() == it->chromosome())
          break;
      }

      if (jt == ret.end())
        ret.emplace_back(*it);
      else
        *jt = genomic_region(jt->chromosome(), std::min(jt->from(), it->from()), std::max(jt->to(), it->to()));
    }

    return ret;
  }

  /**
   * Tests whether [start, end] intersects the region's interval. The contig
   * is not compared.
   */
  inline bool region_overlaps(std::uint64_t start, std::uint64_t end, const genomic_region& reg)
  {
    return start <= reg.to() && end >= reg.from();
  }

  /**
   * Parses "chr", "chr:pos", "chr:beg-end" or "chr:beg-".
   * @throws std::invalid_argument on an empty contig, malformed numbers or beg > end
   */
  genomic_region string_to_region(const std::string& s);
}

#endif // LIBHAPKIT_REGION_HPP
