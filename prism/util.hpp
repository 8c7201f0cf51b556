/*
  Copyright (c) 2026 The Prism Authors

  This file is part of Prism.

  Prism is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Prism is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with Prism.  If not, see <http://www.gnu.org/licenses/>.
*/
#ifndef UTIL_HPP__
#define UTIL_HPP__

#include "errors.hpp"
#include <boost/algorithm/hex.hpp>
#include <stdint.h>
#include <iterator>
#include <string>
#include <vector>

namespace prism {

typedef std::vector<uint8_t> Bytes;

namespace util {

/// Upper case hex, two digits per byte, no separators
inline std::string BytesToHex(const Bytes& data)
{
  std::string result;
  boost::algorithm::hex(data.begin(), data.end(), std::back_inserter(result));
  return result;
}

/// Parse case insensitive hex of even length; "" yields an empty buffer
/// @throw InvalidHexError on odd length or a non hex character
inline Bytes HexToBytes(const std::string& text)
{
  Bytes result;
  try {
    boost::algorithm::unhex(text.begin(), text.end(), std::back_inserter(result));
  } catch (const boost::algorithm::non_hex_input&) {
    throw InvalidHexError(text, "non hex character");
  } catch (const boost::algorithm::not_enough_input&) {
    throw InvalidHexError(text, "odd number of digits");
  }
  return result;
}

}
}

#endif // UTIL_HPP__
