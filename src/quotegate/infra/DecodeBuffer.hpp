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

#include <cstddef>
#include <vector>

namespace quotegate
{

/* Inbound bytes that have been read from a socket but not yet decoded.
 * Storage starts small and grows to at most `max_size`, which bounds the
 * largest frame a peer can send. */
class DecodeBuffer
{
public:
  DecodeBuffer(size_t initial_size, size_t max_size);

  /* Append as many of `len` bytes as fit and return how many were taken.
   * Throws when the buffer is already at its limit. */
  size_t append(const char* src, size_t len);

  char* data() { return _bytes.data(); }

  size_t size() const { return _bytes.size(); }

  /* Remove the first `n` bytes, which the caller has decoded */
  void drop_front(size_t n);

private:
  std::vector<char> _bytes;
  size_t _max_size;
};

} // namespace quotegate
