/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef LIBHAPKIT_HEADER_HPP
#define LIBHAPKIT_HEADER_HPP

#include "schema.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace hapkit
{
  /**
   * Contiguous block of '#' lines at the top of a file. Extra field
   * declarations are kept in the schema; every other comment line is kept
   * verbatim in file order.
   */
  class header
  {
  public:
    header() : schema_(std::make_shared<::hapkit::schema>()) {}
    header(std::vector<std::string> comments, ::hapkit::schema s);

    const std::vector<std::string>& comments() const { return comments_; }
    const ::hapkit::schema& schema() const { return *schema_; }
    std::shared_ptr<const ::hapkit::schema> shared_schema() const { return schema_; }

    /**
     * Adds a comment line. A leading '#' is added when missing.
     * @throws malformed_line_error if line is an extra field declaration or contains a newline
     */
    void add_comment(std::string line);

    /**
     * Consumes the '#' prefix block of a stream and stops before the first data line.
     * @param is Input stream
     * @param lines_read Incremented for each consumed line
     * @return Parsed header
     */
    static header parse(std::istream& is, std::size_t& lines_read);

    /**
     * Writes comments verbatim followed by regenerated declarations.
     */
    void write(std::ostream& os) const;
  private:
    std::vector<std::string> comments_;
    std::shared_ptr<const ::hapkit::schema> schema_;
  };
}

#endif // LIBHAPKIT_HEADER_HPP
