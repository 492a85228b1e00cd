/* Copyright 2024 Automated Algo (www.automatedalgo.com)

This file is part of Automated Algo's "Quotegate" project.

Quotegate is free software: you can redistribute it and/or modify it under the
terms of the GNU Lesser General Public License as published by the Free
Software Foundation, either version 3 of the License, or (at your option) any
later version.

Quotegate is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License along
with Quotegate. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <quotegate/util/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace quotegate
{

/* Split one line of delimited text into fields.  Fields may be enclosed in
 * double quotes, in which case they can contain the delimiter, and a doubled
 * quote stands for a literal quote.  Throws parse_error on an unterminated
 * quoted field. */
std::vector<std::string> split_delimited_line(std::string_view line,
                                              char delim = ',');

/* Decode a delimited-text document whose first line is a header.  Returns a
 * json array with one object per data row, keyed by the header fields; field
 * values are kept as strings.  Blank lines are skipped.  Throws parse_error
 * when a row's field count differs from the header. */
json decode_delimited_text(const std::string& body, char delim = ',');

} // namespace quotegate
