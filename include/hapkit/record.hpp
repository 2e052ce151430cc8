/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_RECORD_HPP
#define LIBHAPKIT_RECORD_HPP

#include "schema.hpp"
#include "typed_value.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hapkit
{
  typedef std::vector<std::pair<std::string, typed_value>> extra_field_list;

  /**
   * Shared extra field storage of H and V records.
   */
  class extra_fields
  {
  public:
    /**
     * Gets vector of extra key-value pairs.
     * @return Extra fields in the order they were set
     */
    const extra_field_list& extra() const { return extra_; }

    /**
     * Gets value of extra field.
     * @tparam T Destination type
     * @param key Field name
     * @param dest Destination object
     * @return False if field is not present or its kind does not fit T
     */
    template <typename T>
    bool get_extra(const std::string& key, T& dest) const
    {
      auto res = std::find_if(extra_.begin(), extra_.end(), [&key](const std::pair<std::string, typed_value>& v) { return v.first == key; });
      if (res != extra_.end())
        return res->second.get(dest);
      return false;
    }

    /**
     * Sets extra field, replacing an existing value with the same name.
     * @param key Field name
     * @param val Value
     */
    void set_extra(const std::string& key, typed_value val)
    {
      for (auto it = extra_.begin(); it != extra_.end(); ++it)
      {
        if (it->first == key)
        {
          it->second = std::move(val);
          return;
        }
      }
      extra_.emplace_back(key, std::move(val));
    }

    const typed_value* find_extra(const std::string& key) const
    {
      auto res = std::find_if(extra_.begin(), extra_.end(), [&key](const std::pair<std::string, typed_value>& v) { return v.first == key; });
      return res == extra_.end() ? nullptr : &res->second;
    }
  protected:
    extra_fields() {}
    extra_fields(extra_field_list extra) : extra_(std::move(extra)) {}

    extra_field_list extra_;
  };

  class haplotype : public extra_fields
  {
    friend class codec;
  private:
    std::string chrom_;
    std::uint64_t start_ = 0;
    std::uint64_t end_ = 0;
    std::string id_;
  public:
    haplotype() {}

    /**
     * Constructs haplotype record.
     * @param chrom Chromosome
     * @param start Start position
     * @param end End position (>= start)
     * @param id Haplotype ID, unique within a file
     * @param extra Extra field values
     */
    haplotype(std::string chrom, std::uint64_t start, std::uint64_t end, std::string id, extra_field_list extra = {}) :
      extra_fields(std::move(extra)),
      chrom_(std::move(chrom)),
      start_(start),
      end_(end),
      id_(std::move(id))
    {
    }

    const std::string& chromosome() const { return chrom_; }
    const std::string& chrom() const { return chrom_; } ///< Shorthand for chromosome().
    std::uint64_t start() const { return start_; }
    std::uint64_t end() const { return end_; }
    const std::string& id() const { return id_; }

    static line_type type() { return line_type::haplotype; }
  };

  class variant : public extra_fields
  {
    friend class codec;
  private:
    std::string hap_id_;
    std::uint64_t start_ = 0;
    std::uint64_t end_ = 0;
    std::string id_;
    std::string allele_;
  public:
    variant() {}

    /**
     * Constructs variant record.
     * @param haplotype_id ID of the haplotype this variant belongs to
     * @param start Start position
     * @param end End position (>= start)
     * @param id Variant ID
     * @param allele Allele
     * @param extra Extra field values
     */
    variant(std::string haplotype_id, std::uint64_t start, std::uint64_t end, std::string id, std::string allele, extra_field_list extra = {}) :
      extra_fields(std::move(extra)),
      hap_id_(std::move(haplotype_id)),
      start_(start),
      end_(end),
      id_(std::move(id)),
      allele_(std::move(allele))
    {
    }

    const std::string& haplotype_id() const { return hap_id_; }
    std::uint64_t start() const { return start_; }
    std::uint64_t end() const { return end_; }
    const std::string& id() const { return id_; }
    const std::string& allele() const { return allele_; }

    static line_type type() { return line_type::variant; }
  };

  /**
   * Either an H or a V record, as produced by streaming readers.
   */
  class record
  {
    friend class codec;
  private:
    line_type type_ = line_type::haplotype;
    haplotype hap_;
    variant var_;
  public:
    record() {}
    record(haplotype h) : type_(line_type::haplotype), hap_(std::move(h)) {}
    record(variant v) : type_(line_type::variant), var_(std::move(v)) {}

    line_type type() const { return type_; }
    bool is_haplotype() const { return type_ == line_type::haplotype; }
    bool is_variant() const { return type_ == line_type::variant; }

    const haplotype& hap() const { return hap_; }
    const variant& var() const { return var_; }
    haplotype& hap() { return hap_; }
    variant& var() { return var_; }

    /// Column 2: chromosome for H records, haplotype ID for V records.
    const std::string& contig() const { return type_ == line_type::haplotype ? hap_.chrom() : var_.haplotype_id(); }
    std::uint64_t start() const { return type_ == line_type::haplotype ? hap_.start() : var_.start(); }
    std::uint64_t end() const { return type_ == line_type::haplotype ? hap_.end() : var_.end(); }
  };

  /**
   * Compares records field by field. Extra fields are compared by name
   * against the schema, with real values compared at declared precision.
   */
  bool equivalent(const haplotype& a, const haplotype& b, const schema& s);
  bool equivalent(const variant& a, const variant& b, const schema& s);
}

#endif // LIBHAPKIT_RECORD_HPP
