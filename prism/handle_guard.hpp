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
/// @brief Ownership of a single driver handle
#ifndef HANDLE_GUARD_HPP__
#define HANDLE_GUARD_HPP__

#include "ni845x.hpp"
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <string>

namespace prism {

class Ni845xDriver;

/// Pairs one driver handle with the driver function that releases it.
///
/// The handle is released at most once: by Release(), or by the destructor when the last reference goes away.
/// Once released the guard stays closed even if the driver reported a failure, so a possibly
/// invalid handle is never passed to the driver again.
class HandleGuard : boost::noncopyable
{
public:
  typedef boost::function<int32_t(NiHandle*)> open_fcn_t;
  typedef boost::function<int32_t(NiHandle)> close_fcn_t;

  /// Call open_fcn to obtain a new handle.
  /// @param description Name of the handle in error messages, e.g. "device"
  /// @param open_name, close_name Driver function names in error messages
  /// @throw TransferError if open_fcn returns a nonzero status
  static boost::shared_ptr<HandleGuard> Acquire(boost::shared_ptr<Ni845xDriver> driver,
                                                const std::string& description,
                                                const open_fcn_t& open_fcn, const char *open_name,
                                                const close_fcn_t& close_fcn, const char *close_name);

  /// Releases the handle if still open; a failure is logged, not thrown
  ~HandleGuard();

  bool IsOpen() const { return !closed_; }

  /// @throw HandleClosedError after Release()
  NiHandle handle() const;

  /// Release the handle. Calling again is a no-op.
  /// @throw TransferError if the driver failed to close the handle (first call only)
  void Release();

  const std::string& description() const { return description_; }

private:
  HandleGuard(boost::shared_ptr<Ni845xDriver> driver, const std::string& description, NiHandle handle,
              const close_fcn_t& close_fcn, const char *close_name);

  boost::shared_ptr<Ni845xDriver> driver_;
  std::string description_;
  NiHandle handle_;
  close_fcn_t close_fcn_;
  const char *close_name_;
  bool closed_;
};

}

#endif // HANDLE_GUARD_HPP__
