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
#ifndef MISC_HPP__
#define MISC_HPP__

#include <boost/shared_ptr.hpp>
#include <stdio.h>

#define PR_ERROR(x ...) fprintf(stderr, x)

namespace prism {

class HardwareBackend;

class Misc {
public:
  /// Apply opt-in tracing requested through the environment (PRISM_TRACE_TRANSFER=yes)
  static void UserTraceSettings(boost::shared_ptr<HardwareBackend>);
};

}

#endif // MISC_HPP__
