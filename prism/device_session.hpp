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
/// @brief A live connection to one NI-845x device
#ifndef DEVICE_SESSION_HPP__
#define DEVICE_SESSION_HPP__

#include "ni845x.hpp"
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <string>
#include <vector>

namespace prism {

class Ni845xDriver;
class HandleGuard;
class TransferConfiguration;
class SpiConfiguration;
class I2cConfiguration;

/// Owns the device handle and every configuration created through it.
///
/// Closing the session closes those configurations too, so a configuration never outlives the
/// device it was made for. The session is not thread safe; callers issue one operation at a time.
class DeviceSession : boost::noncopyable
{
public:
  /// List connected devices in the order the driver reports them.
  /// @return empty if driver is empty (library not loaded) or no device was found
  /// @throw TransferError on a nonzero driver status
  static std::vector<std::string> Enumerate(boost::shared_ptr<Ni845xDriver> driver);

  /// Open a session to the named device, e.g. "USB0::0x3923::0x7166::01234567::RAW"
  /// @throw DriverUnavailableError if driver is empty
  /// @throw DeviceOpenError if the driver refuses the resource
  static boost::shared_ptr<DeviceSession> Open(boost::shared_ptr<Ni845xDriver> driver, const std::string& resource);

  ~DeviceSession();

  bool IsOpen() const;

  /// @throw HandleClosedError after Close()
  NiHandle handle() const;

  const std::string& resource() const { return resource_; }
  boost::shared_ptr<Ni845xDriver> driver() const { return driver_; }

  /// Last timeout applied with SetTimeout(), 0 if never set
  uint32_t timeout_ms() const { return timeout_ms_; }
  /// Last IO voltage code applied with SetIoVoltage(), 0 if never set
  uint8_t io_voltage() const { return io_voltage_; }

  /// Bounds every subsequent blocking driver call on this device
  void SetTimeout(uint32_t timeout_ms);

  /// @param voltage_code kNi845x33Volts etc.
  void SetIoVoltage(uint8_t voltage_code);

  boost::shared_ptr<SpiConfiguration> CreateSpiConfiguration();
  boost::shared_ptr<I2cConfiguration> CreateI2cConfiguration();

  /// Configurations created here that are still open
  size_t configuration_count() const;

  /// Close the configurations created by this session, then the device. Idempotent.
  /// Every handle is released even if one of them fails; the first failure is then thrown.
  void Close();

private:
  DeviceSession(boost::shared_ptr<Ni845xDriver> driver, const std::string& resource,
                boost::shared_ptr<HandleGuard> guard);

  /// Remember config for Close(), forgetting configurations already closed on their own
  void Track(boost::shared_ptr<TransferConfiguration> config);

  boost::shared_ptr<Ni845xDriver> driver_;
  std::string resource_;
  boost::shared_ptr<HandleGuard> guard_;
  std::vector<boost::shared_ptr<TransferConfiguration> > configurations_;
  uint32_t timeout_ms_;
  uint8_t io_voltage_;
};

}

#endif // DEVICE_SESSION_HPP__
