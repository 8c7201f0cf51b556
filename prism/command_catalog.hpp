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
/// @file
/// @brief Named commands offered to the user
#ifndef COMMAND_CATALOG_HPP__
#define COMMAND_CATALOG_HPP__

#include <stddef.h>

namespace prism {

struct CatalogEntry
{
  const char *label;   ///< Presentation name
  const char *hex;     ///< Wire payload
};

class CommandCatalog
{
public:
  /// Built-in entries, in presentation order
  static const CatalogEntry *Builtin(size_t& count);

  /// Exact, case sensitive label match
  /// @return NULL if there is no such entry
  static const CatalogEntry *Find(const char *label);
};

}

#endif // COMMAND_CATALOG_HPP__
