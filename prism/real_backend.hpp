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
/// @brief HardwareBackend implementation on the NI-845x driver
#ifndef REAL_BACKEND_HPP__
#define REAL_BACKEND_HPP__

#include "hardware_backend.hpp"
#include "settings.hpp"

namespace prism {

class Ni845xDriver;
class DeviceSession;
class SpiConfiguration;

/// Delegates to DeviceSession and TransferEngine.
/// Timeout and IO voltage are applied on open; the SPI configuration is created and
/// configured from Settings just before the first transfer.
class RealBackend : public HardwareBackend
{
public:
  /// @param driver May be empty, in which case every device call fails with DriverUnavailableError
  RealBackend(boost::shared_ptr<Ni845xDriver> driver, const Settings& settings);
  virtual ~RealBackend();

  virtual bool IsOpen() const;

  /// The open session, for operations outside the facade (I2C, DIO); empty when closed
  boost::shared_ptr<DeviceSession> session() const { return session_; }

protected:
  virtual std::vector<std::string> DoFindDevices();
  virtual void DoOpenDevice(const std::string& resource);
  virtual void DoCloseDevice();
  virtual Bytes DoTransfer(const Bytes& command);

private:
  boost::shared_ptr<Ni845xDriver> driver_;
  Settings settings_;
  boost::shared_ptr<DeviceSession> session_;
  boost::shared_ptr<SpiConfiguration> spi_config_;
};

}

#endif // REAL_BACKEND_HPP__
