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
/// @brief HardwareBackend without hardware, for development and tests
#ifndef SIMULATED_BACKEND_HPP__
#define SIMULATED_BACKEND_HPP__

#include "hardware_backend.hpp"

namespace prism {

/// Pretends a single device is attached.
/// Transfers return the command with its bytes reversed, e.g. DEADBEEF --> EFBEADDE.
class SimulatedBackend : public HardwareBackend
{
public:
  SimulatedBackend();
  virtual ~SimulatedBackend();

  /// The one device FindDevices() reports
  static const char *DeviceName() { return "SIM-845x"; }

  virtual bool IsOpen() const { return open_; }

protected:
  virtual std::vector<std::string> DoFindDevices();
  virtual void DoOpenDevice(const std::string& resource);
  virtual void DoCloseDevice();
  virtual Bytes DoTransfer(const Bytes& command);

private:
  bool open_;
};

}

#endif // SIMULATED_BACKEND_HPP__
