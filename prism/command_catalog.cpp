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
#include "command_catalog.hpp"
#include <string.h>

namespace prism {

namespace {

const CatalogEntry kBuiltin[] = {
  { "Read Status", "0100" },
  { "Write Enable", "06" },
  { "Chip Erase", "C7" },
};

const size_t kBuiltinCount = sizeof(kBuiltin) / sizeof(kBuiltin[0]);

}

const CatalogEntry *CommandCatalog::Builtin(size_t& count)
{
  count = kBuiltinCount;
  return kBuiltin;
}

const CatalogEntry *CommandCatalog::Find(const char *label)
{
  for (size_t i=0; i < kBuiltinCount; i++) {
    if (strcmp(kBuiltin[i].label, label)==0) { return &kBuiltin[i]; }
  }
  return NULL;
}

}
