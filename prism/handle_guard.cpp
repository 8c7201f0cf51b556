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
#include "handle_guard.hpp"
#include "ni845x_driver.hpp"
#include "errors.hpp"
#include "misc.hpp"

using boost::shared_ptr;

namespace prism {

shared_ptr<HandleGuard> HandleGuard::Acquire(shared_ptr<Ni845xDriver> driver,
                                             const std::string& description,
                                             const open_fcn_t& open_fcn, const char *open_name,
                                             const close_fcn_t& close_fcn, const char *close_name)
{
  NiHandle handle = 0;
  CheckStatus(*driver, open_fcn(&handle), open_name);
  return shared_ptr<HandleGuard>(new HandleGuard(driver, description, handle, close_fcn, close_name));
}

HandleGuard::HandleGuard(shared_ptr<Ni845xDriver> driver, const std::string& description, NiHandle handle,
                         const close_fcn_t& close_fcn, const char *close_name)
: driver_(driver),
  description_(description),
  handle_(handle),
  close_fcn_(close_fcn),
  close_name_(close_name),
  closed_(false)
{
}

HandleGuard::~HandleGuard()
{
  try {
    Release();
  } catch (const Error& e) {
    PR_ERROR("Releasing %s handle: %s\n", description_.c_str(), e.what());
  }
}

NiHandle HandleGuard::handle() const
{
  if (closed_) { throw HandleClosedError(description_); }
  return handle_;
}

void HandleGuard::Release()
{
  if (closed_) { return; }
  // Closed from here on, whatever the driver says
  closed_ = true;
  CheckStatus(*driver_, close_fcn_(handle_), close_name_);
}

}
