/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/linear_index.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/utility.hpp"

#include <htslib/bgzf.h>
#include <htslib/kstring.h>

#include <endian.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace hapkit
{
  const char linear_index::magic[4] = {'h', 'p', 'i', '\x01'};

  namespace
  {
    typedef std::unique_ptr<BGZF, int(*)(BGZF*)> bgzf_ptr;

    struct kstring_holder
    {
      kstring_t str = {0, 0, nullptr};
      ~kstring_holder() { free(str.s); }
    };

    bgzf_ptr open_bgzf(const std::string& file_path)
    {
      bgzf_ptr ret(bgzf_open(file_path.c_str(), "r"), bgzf_close);
      if (!ret)
        throw io_error("could not open file", file_path);
      if (bgzf_compression(ret.get()) != 2) // 2: BGZF
        throw io_error("file is not BGZF compressed", file_path);
      return ret;
    }

    class linear_cursor : public line_cursor
    {
    public:
      linear_cursor(const std::string& file_path, std::uint64_t virtual_offset, std::uint64_t record_count) :
        file_path_(file_path),
        fp_(nullptr, bgzf_close),
        remaining_(record_count)
      {
        if (remaining_)
        {
          fp_ = open_bgzf(file_path);
          if (bgzf_seek(fp_.get(), std::int64_t(virtual_offset), SEEK_SET) < 0)
            throw io_error("seek failed", file_path);
        }
      }

      bool next(std::string& line)
      {
        while (remaining_)
        {
          int res = bgzf_getline(fp_.get(), '\n', &buf_.str);
          if (res < -1)
            throw io_error("read failure", file_path_);
          if (res < 0)
            return false;

          if (buf_.str.l && buf_.str.s[0] == '#')
            continue;

          --remaining_;
          line.assign(buf_.str.s, buf_.str.l);
          return true;
        }
        return false;
      }
    private:
      std::string file_path_;
      bgzf_ptr fp_;
      std::uint64_t remaining_;
      kstring_holder buf_;
    };

    void read_be(std::istream& is, std::uint32_t& dest)
    {
      std::uint32_t v = 0;
      is.read((char*)(&v), sizeof(v));
      dest = be32toh(v);
    }

    void read_be(std::istream& is, std::uint64_t& dest)
    {
      std::uint64_t v = 0;
      is.read((char*)(&v), sizeof(v));
      dest = be64toh(v);
    }

    void write_be(std::ostream& os, std::uint32_t v)
    {
      v = htobe32(v);
      os.write((char*)(&v), sizeof(v));
    }

    void write_be(std::ostream& os, std::uint64_t v)
    {
      v = htobe64(v);
      os.write((char*)(&v), sizeof(v));
    }
  }

  void linear_index::build(const std::string& file_path)
  {
    if (opts_.records_per_block == 0)
      throw std::invalid_argument("records_per_block must be positive");

    detail::check_sorted(file_path);

    bgzf_ptr fp = open_bgzf(file_path);
    kstring_holder buf;
    contig_table table;
    std::size_t line_number = 0;

    std::int64_t voffset = bgzf_tell(fp.get());
    int res;
    while ((res = bgzf_getline(fp.get(), '\n', &buf.str)) >= 0)
    {
      ++line_number;
      if (buf.str.l && buf.str.s[0] == '#')
      {
        voffset = bgzf_tell(fp.get());
        continue;
      }

      std::vector<std::string> cols = detail::split_string_to_vector(buf.str.s, buf.str.s + buf.str.l, '\t');
      std::uint64_t start = 0, end = 0;
      if (cols.size() < 4 || !detail::parse_uint64(cols[2], start) || !detail::parse_uint64(cols[3], end))
        throw malformed_line_error("invalid coordinates", line_number);

      if (table.empty() || table.back().first != cols[1])
        table.emplace_back(cols[1], std::vector<checkpoint>());

      std::vector<checkpoint>& cps = table.back().second;
      if (cps.empty() || cps.back().record_count >= opts_.records_per_block)
        cps.push_back(checkpoint{start, end, std::uint64_t(voffset), 0});

      checkpoint& cp = cps.back();
      cp.min_start = std::min(cp.min_start, start);
      cp.max_end = std::max(cp.max_end, end);
      ++cp.record_count;

      voffset = bgzf_tell(fp.get());
    }

    if (res < -1)
      throw io_error("read failure", file_path);

    write_index(index_path(file_path), table);

    {
      std::lock_guard<std::mutex> lock(mtx_);
      loaded_.erase(file_path);
    }

    logger::log(log_level::info, "wrote %s (%zu contigs)", index_path(file_path).c_str(), table.size());
  }

  bool linear_index::index_exists(const std::string& file_path) const
  {
    return detail::file_exists(index_path(file_path));
  }

  void linear_index::write_index(const std::string& index_file_path, const contig_table& table)
  {
    std::ofstream ofs(index_file_path, std::ios::binary);
    if (!ofs)
      throw io_error("could not open index for writing", index_file_path);

    ofs.write(magic, sizeof(magic));
    write_be(ofs, std::uint32_t(table.size()));
    for (auto it = table.begin(); it != table.end(); ++it)
    {
      write_be(ofs, std::uint32_t(it->first.size()));
      ofs.write(it->first.data(), it->first.size());
      write_be(ofs, std::uint64_t(it->second.size()));
      for (auto jt = it->second.begin(); jt != it->second.end(); ++jt)
      {
        write_be(ofs, jt->min_start);
        write_be(ofs, jt->max_end);
        write_be(ofs, jt->virtual_offset);
        write_be(ofs, jt->record_count);
      }
    }

    ofs.close();
    if (!ofs)
      throw io_error("failed to write index", index_file_path);
  }

  linear_index::contig_table linear_index::read_index(const std::string& index_file_path)
  {
    std::ifstream ifs(index_file_path, std::ios::binary);
    if (!ifs)
      throw io_error("could not open index", index_file_path);

    char file_magic[sizeof(magic)] = {};
    ifs.read(file_magic, sizeof(file_magic));
    if (!ifs || !std::equal(file_magic, file_magic + sizeof(file_magic), magic))
      throw io_error("not an hpi index", index_file_path);

    contig_table ret;
    std::uint32_t n_contigs = 0;
    read_be(ifs, n_contigs);
    for (std::uint32_t i = 0; i < n_contigs && ifs; ++i)
    {
      std::uint32_t name_size = 0;
      read_be(ifs, name_size);
      std::string name(name_size, '\0');
      if (name_size)
        ifs.read(&name[0], name_size);

      std::uint64_t n_checkpoints = 0;
      read_be(ifs, n_checkpoints);
      std::vector<checkpoint> cps;
      for (std::uint64_t j = 0; j < n_checkpoints && ifs; ++j)
      {
        checkpoint cp;
        read_be(ifs, cp.min_start);
        read_be(ifs, cp.max_end);
        read_be(ifs, cp.virtual_offset);
        read_be(ifs, cp.record_count);
        cps.push_back(cp);
      }

      ret.emplace_back(std::move(name), std::move(cps));
    }

    if (!ifs)
      throw io_error("truncated index", index_file_path);

    return ret;
  }

  std::shared_ptr<const linear_index::contig_table> linear_index::load(const std::string& file_path) const
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = loaded_.find(file_path);
    if (it != loaded_.end())
      return it->second;

    if (!index_exists(file_path))
      throw io_error("index not found", index_path(file_path));

    std::shared_ptr<const contig_table> ret = std::make_shared<contig_table>(read_index(index_path(file_path)));
    loaded_[file_path] = ret;
    return ret;
  }

  std::unique_ptr<line_cursor> linear_index::query(const std::string& file_path, const genomic_region& reg) const
  {
    std::shared_ptr<const contig_table> table = load(file_path);

    auto contig_it = std::find_if(table->begin(), table->end(), [&reg](const contig_table::value_type& c) { return c.first == reg.chromosome(); });
    if (contig_it == table->end())
    {
      logger::log(log_level::debug, "contig %s not in index of %s", reg.chromosome().c_str(), file_path.c_str());
      return std::unique_ptr<line_cursor>(new linear_cursor(file_path, 0, 0));
    }

    const std::vector<checkpoint>& cps = contig_it->second;
    auto cp_it = std::find_if(cps.begin(), cps.end(), [&reg](const checkpoint& cp) { return cp.max_end >= reg.from(); });
    if (cp_it == cps.end() || cp_it->min_start > reg.to())
      return std::unique_ptr<line_cursor>(new linear_cursor(file_path, 0, 0));

    std::uint64_t remaining = 0;
    for (auto it = cp_it; it != cps.end(); ++it)
      remaining += it->record_count;

    return std::unique_ptr<line_cursor>(new linear_cursor(file_path, cp_it->virtual_offset, remaining));
  }
}
