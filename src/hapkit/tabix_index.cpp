/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/tabix_index.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/utility.hpp"

#include <htslib/hts.h>
#include <htslib/kstring.h>

#include <cstdlib>

namespace hapkit
{
  namespace
  {
    class tabix_cursor : public line_cursor
    {
    public:
      tabix_cursor(const std::string& file_path, std::shared_ptr<tbx_t> tbx, hts_itr_t* itr) :
        file_path_(file_path),
        tbx_(std::move(tbx)),
        fp_(hts_open(file_path.c_str(), "r")),
        itr_(itr)
      {
        if (!fp_)
        {
          if (itr_)
            tbx_itr_destroy(itr_);
          throw io_error("could not open file", file_path);
        }
      }

      ~tabix_cursor()
      {
        free(str_.s);
        if (itr_)
          tbx_itr_destroy(itr_);
        hts_close(fp_);
      }

      bool next(std::string& line)
      {
        if (!itr_)
          return false;

        int res = tbx_itr_next(fp_, tbx_.get(), itr_, &str_);
        if (res < -1)
          throw io_error("failed to read tabix region", file_path_);
        if (res < 0)
          return false;

        line.assign(str_.s, str_.l);
        return true;
      }
    private:
      std::string file_path_;
      std::shared_ptr<tbx_t> tbx_;
      htsFile* fp_;
      hts_itr_t* itr_;
      kstring_t str_ = {0, 0, nullptr};
    };
  }

  tbx_conf_t tabix_index::config()
  {
    tbx_conf_t conf = tbx_conf_gff;
    conf.preset = TBX_GENERIC;
    conf.sc = 2;
    conf.bc = 3;
    conf.ec = 4;
    conf.meta_char = '#';
    conf.line_skip = 0;
    return conf;
  }

  void tabix_index::build(const std::string& file_path)
  {
    std::size_t cnt = detail::check_sorted(file_path);

    tbx_conf_t conf = config();
    int res = tbx_index_build3(file_path.c_str(), nullptr, 0, 0, &conf);
    if (res == -2)
      throw io_error("file is not BGZF compressed", file_path);
    if (res < 0)
      throw io_error("failed to build tabix index", file_path);

    {
      std::lock_guard<std::mutex> lock(mtx_);
      loaded_.erase(file_path);
    }

    logger::log(log_level::info, "indexed %zu lines of %s", cnt, file_path.c_str());
  }

  bool tabix_index::index_exists(const std::string& file_path) const
  {
    return detail::file_exists(index_path(file_path));
  }

  std::shared_ptr<tbx_t> tabix_index::load(const std::string& file_path) const
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = loaded_.find(file_path);
    if (it != loaded_.end())
      return it->second;

    if (!index_exists(file_path))
      throw io_error("index not found", index_path(file_path));

    std::shared_ptr<tbx_t> ret(tbx_index_load(file_path.c_str()), [](tbx_t* t) { if (t) tbx_destroy(t); });
    if (!ret)
      throw io_error("could not load tabix index", index_path(file_path));

    loaded_[file_path] = ret;
    return ret;
  }

  std::unique_ptr<line_cursor> tabix_index::query(const std::string& file_path, const genomic_region& reg) const
  {
    std::shared_ptr<tbx_t> tbx = load(file_path);

    hts_itr_t* itr = nullptr;
    int tid = tbx_name2id(tbx.get(), reg.chromosome().c_str());
    if (tid >= 0)
    {
      hts_pos_t beg = reg.from() > 0 ? hts_pos_t(reg.from() - 1) : 0;
      hts_pos_t end = reg.to() >= std::uint64_t(HTS_POS_MAX) ? HTS_POS_MAX : hts_pos_t(reg.to());
      itr = tbx_itr_queryi(tbx.get(), tid, beg, end);
      if (!itr)
        throw io_error("tabix query failed for " + reg.chromosome(), file_path);
    }
    else
    {
      logger::log(log_level::debug, "contig %s not in index of %s", reg.chromosome().c_str(), file_path.c_str());
    }

    return std::unique_ptr<line_cursor>(new tabix_cursor(file_path, std::move(tbx), itr));
  }
}
