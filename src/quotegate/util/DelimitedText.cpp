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

#include <quotegate/util/DelimitedText.hpp>
#include <quotegate/util/utils.hpp>

#include <fast-cpp-csv-parser/csv.h>

namespace quotegate
{

std::vector<std::string> split_delimited_line(std::string_view line, char delim)
{
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current += '"';
          ++i;
        } else
          in_quotes = false;
      } else
        current += c;
    } else if (c == '"' && current.empty()) {
      in_quotes = true;
    } else if (c == delim) {
      fields.push_back(std::move(current));
      current.clear();
    } else
      current += c;
  }

  if (in_quotes)
    THROW_PARSE_ERROR("unterminated quoted field in line '" << line << "'");

  fields.push_back(std::move(current));
  return fields;
}


json decode_delimited_text(const std::string& body, char delim)
{
  json rows = json::array();

  std::vector<std::string> header;
  size_t line_no = 0;

  try {
    io::LineReader reader("response-body", body.data(),
                          body.data() + body.size());

    while (char* raw = reader.next_line()) {
      ++line_no;
      std::string_view line{raw};
      if (trim(line).empty())
        continue;

      auto fields = split_delimited_line(line, delim);

      if (header.empty()) {
        for (auto& f : fields)
          header.push_back(trim(f));
        continue;
      }

      if (fields.size() != header.size())
        THROW_PARSE_ERROR("delimited text line " << line_no << " has "
                          << fields.size() << " fields, header has "
                          << header.size());

      json row = json::object();
      for (size_t i = 0; i < header.size(); ++i)
        row[header[i]] = std::move(fields[i]);
      rows.push_back(std::move(row));
    }
  } catch (const io::error::base& e) {
    THROW_PARSE_ERROR("delimited text read failed: " << e.what());
  }

  return rows;
}

} // namespace quotegate
