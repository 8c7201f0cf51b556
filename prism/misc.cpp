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
#include "misc.hpp"
#include "hardware_backend.hpp"
#include <stdlib.h>
#include <string.h>

using boost::shared_ptr;

namespace prism {

void Misc::UserTraceSettings(shared_ptr<HardwareBackend> backend)
{
  char *p;

  backend->TraceTransfers( (p=getenv("PRISM_TRACE_TRANSFER")) && strcmp(p, "yes")==0);
}

}
