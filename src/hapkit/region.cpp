/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/region.hpp"
#include "hapkit/utility.hpp"

#include <stdexcept>

namespace hapkit
{
  namespace
  {
    std::uint64_t parse_bound(const std::string& s, const std::string& region_str)
    {
      std::uint64_t ret = 0;
      if (!detail::parse_uint64(s, ret))
        throw std::invalid_argument("invalid position '" + s + "' in region " + region_str);
      return ret;
    }
  }

  genomic_region string_to_region(const std::string& s)
  {
    const std::size_t colon_pos = s.find(':');
    std::string chr = s.substr(0, colon_pos);
    if (chr.empty())
      throw std::invalid_argument("region has no contig: " + s);

    if (colon_pos == std::string::npos)
      return genomic_region(chr);

    const std::size_t hyphen_pos = s.find('-', colon_pos + 1);
    if (hyphen_pos == std::string::npos)
    {
      std::uint64_t locus = parse_bound(s.substr(colon_pos + 1), s);
      return genomic_region(chr, locus, locus);
    }

    std::uint64_t beg = parse_bound(s.substr(colon_pos + 1, hyphen_pos - colon_pos - 1), s);
    std::string send = s.substr(hyphen_pos + 1);
    if (send.empty())
      return genomic_region(chr, beg);

    std::uint64_t end = parse_bound(send, s);
    if (end < beg)
      throw std::invalid_argument("region ends before it begins: " + s);
    return genomic_region(chr, beg, end);
  }
}
