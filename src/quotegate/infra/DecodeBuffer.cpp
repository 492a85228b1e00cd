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

#include <quotegate/infra/DecodeBuffer.hpp>
#include <quotegate/util/Error.hpp>

#include <algorithm>

namespace quotegate
{

DecodeBuffer::DecodeBuffer(size_t initial_size, size_t max_size)
  : _max_size(std::max<size_t>(max_size, 1))
{
  _bytes.reserve(std::min(initial_size, _max_size));
}


size_t DecodeBuffer::append(const char* src, size_t len)
{
  size_t room = _max_size - _bytes.size();
  if (len > 0 && room == 0)
    THROW("decode buffer full at " << _max_size << " bytes");

  size_t taken = std::min(room, len);
  _bytes.insert(_bytes.end(), src, src + taken);
  return taken;
}


void DecodeBuffer::drop_front(size_t n)
{
  _bytes.erase(_bytes.begin(),
               _bytes.begin() + static_cast<std::ptrdiff_t>(std::min(n, _bytes.size())));
}

} // namespace quotegate
