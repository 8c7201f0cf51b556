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
/// @brief Facade over real or simulated NI-845x hardware
#ifndef HARDWARE_BACKEND_HPP__
#define HARDWARE_BACKEND_HPP__

#include "errors.hpp"
#include "util.hpp"
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <string>
#include <vector>

namespace prism {

struct Settings;

enum BackendKind {
  kRealBackend,        ///< NI-845x driver and hardware
  kSimulatedBackend    ///< Loopback without hardware
};

const char *BackendKindName(BackendKind kind);

/// Abstract interface to the adapter as seen by an application.
/// Subclassed by RealBackend and SimulatedBackend.
///
/// Failures never escape as exceptions: each call returns a failure result and keeps the
/// reason in last_error() / last_error_kind() until the next call.
/// Only one device is open at a time; the caller serializes access.
class HardwareBackend : boost::noncopyable
{
public:
  virtual ~HardwareBackend();

  /// Create a backend of the given kind.
  /// A real backend is returned even without a driver; its device calls then fail.
  static boost::shared_ptr<HardwareBackend> GetInstance(BackendKind kind, const Settings& settings);

  /// kRealBackend if the driver library loaded and simulation was not requested
  static BackendKind DefaultKind(const Settings& settings);

  BackendKind kind() const { return kind_; }

  virtual bool IsOpen() const = 0;

  /// @return resource names in driver order, empty on failure
  std::vector<std::string> FindDevices();

  /// Open a device; the current one is closed once the new one is open.
  /// @return false on error; the current device, if any, stays open
  bool OpenDevice(const std::string& resource);

  /// Close the current device, if any. A driver failure is recorded but the backend ends up closed.
  void CloseDevice();

  /// Send command, receive response of the same length.
  /// @param response Unchanged on failure
  /// @return false on error
  bool Transfer(const Bytes& command, Bytes& response);

  /// As Transfer, on hex text.
  /// Malformed hex is rejected before any hardware access; the response is upper case.
  bool TransferHex(const std::string& command_hex, std::string& response_hex);

  const std::string& last_error() const { return last_error_; }
  ErrorKind last_error_kind() const { return last_error_kind_; }

  /// Log every transfer, with its duration, on stderr
  inline void TraceTransfers(bool enabled) { trace_transfers_ = enabled; }

protected:
  explicit HardwareBackend(BackendKind kind);

  // Implementations report failure by throwing prism::Error
  virtual std::vector<std::string> DoFindDevices() = 0;
  virtual void DoOpenDevice(const std::string& resource) = 0;
  virtual void DoCloseDevice() = 0;
  virtual Bytes DoTransfer(const Bytes& command) = 0;

private:
  void RecordError(const Error& e);
  void ClearError();

  BackendKind kind_;
  std::string last_error_;
  ErrorKind last_error_kind_;
  bool trace_transfers_;
};

}

#endif // HARDWARE_BACKEND_HPP__
