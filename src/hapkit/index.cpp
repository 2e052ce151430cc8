/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/index.hpp"
#include "hapkit/tabix_index.hpp"
#include "hapkit/codec.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/header.hpp"
#include "hapkit/utility.hpp"
#include "hapkit/validator.hpp"

#include <shrinkwrap/istream.hpp>

namespace hapkit
{
  std::shared_ptr<index_service> default_index_service()
  {
    return std::make_shared<tabix_index>();
  }

  namespace detail
  {
    std::size_t check_sorted(const std::string& file_path)
    {
      if (!detail::file_exists(file_path))
        throw io_error("could not open file", file_path);

      shrinkwrap::istream input(file_path);
      if (!input.good())
        throw io_error("could not open file", file_path);

      std::size_t line_number = 0;
      header hdr = header::parse(input, line_number);

      sort_checker checker;
      record rec;
      std::string line;
      std::size_t cnt = 0;
      while (std::getline(input, line))
      {
        ++line_number;
        codec::parse(line, hdr.schema(), rec, line_number);
        checker.check(rec, line_number, line);
        ++cnt;
      }

      if (input.bad())
        throw io_error("read failure", file_path);

      return cnt;
    }
  }
}
