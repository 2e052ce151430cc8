/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "hapkit/header.hpp"
#include "hapkit/errors.hpp"

namespace hapkit
{
  header::header(std::vector<std::string> comments, ::hapkit::schema s) :
    schema_(std::make_shared<::hapkit::schema>(std::move(s)))
  {
    for (auto it = comments.begin(); it != comments.end(); ++it)
      add_comment(std::move(*it));
  }

  void header::add_comment(std::string line)
  {
    if (line.empty() || line.front() != '#')
      line.insert(line.begin(), '#');

    if (line.find('\n') != std::string::npos)
      throw malformed_line_error("comment contains a newline");

    if (::hapkit::schema::is_declaration_line(line))
      throw malformed_line_error("extra field declarations belong to the schema: " + line);

    comments_.emplace_back(std::move(line));
  }

  header header::parse(std::istream& is, std::size_t& lines_read)
  {
    header ret;
    ::hapkit::schema s;

    std::string line;
    while (is.peek() == '#')
    {
      if (!std::getline(is, line))
        break;
      ++lines_read;

      if (::hapkit::schema::is_declaration_line(line))
        s.declare_from_line(line, lines_read);
      else
        ret.comments_.emplace_back(std::move(line));
    }

    ret.schema_ = std::make_shared<::hapkit::schema>(std::move(s));
    return ret;
  }

  void header::write(std::ostream& os) const
  {
    for (auto it = comments_.begin(); it != comments_.end(); ++it)
      os.write(it->data(), it->size()).put('\n');

    std::vector<std::string> decls = schema_->declaration_lines();
    for (auto it = decls.begin(); it != decls.end(); ++it)
      os.write(it->data(), it->size()).put('\n');
  }
}
