/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/record.hpp"

namespace hapkit
{
  namespace
  {
    bool extra_equivalent(const extra_fields& a, const extra_fields& b, line_type type, const schema& s)
    {
      const std::vector<field_declaration>& decls = s.fields_for(type);
      for (auto it = decls.begin(); it != decls.end(); ++it)
      {
        const typed_value* va = a.find_extra(it->name);
        const typed_value* vb = b.find_extra(it->name);
        if (!va || !vb)
        {
          if (va != vb)
            return false;
          continue;
        }

        if (!typed_value::equivalent(*va, *vb, it->format))
          return false;
      }

      // Undeclared values never reach a file, but must still match.
      for (auto it = a.extra().begin(); it != a.extra().end(); ++it)
      {
        if (s.field_index(type, it->first) >= 0)
          continue;
        const typed_value* vb = b.find_extra(it->first);
        if (!vb || *vb != it->second)
          return false;
      }

      for (auto it = b.extra().begin(); it != b.extra().end(); ++it)
      {
        if (s.field_index(type, it->first) < 0 && !a.find_extra(it->first))
          return false;
      }

      return true;
    }
  }

  bool equivalent(const haplotype& a, const haplotype& b, const schema& s)
  {
    return a.chrom() == b.chrom()
      && a.start() == b.start()
      && a.end() == b.end()
      && a.id() == b.id()
      && extra_equivalent(a, b, line_type::haplotype, s);
  }

  bool equivalent(const variant& a, const variant& b, const schema& s)
  {
    return a.haplotype_id() == b.haplotype_id()
      && a.start() == b.start()
      && a.end() == b.end()
      && a.id() == b.id()
      && a.allele() == b.allele()
      && extra_equivalent(a, b, line_type::variant, s);
  }
}
