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
#include "simulated_backend.hpp"

namespace prism {

SimulatedBackend::SimulatedBackend()
: HardwareBackend(kSimulatedBackend),
  open_(false)
{
}

SimulatedBackend::~SimulatedBackend()
{
}

std::vector<std::string> SimulatedBackend::DoFindDevices()
{
  return std::vector<std::string>(1, DeviceName());
}

void SimulatedBackend::DoOpenDevice(const std::string& resource)
{
  open_ = true;
}

void SimulatedBackend::DoCloseDevice()
{
  open_ = false;
}

Bytes SimulatedBackend::DoTransfer(const Bytes& command)
{
  if (!open_) { throw ConnectionError("No device is currently open."); }
  return Bytes(command.rbegin(), command.rend());
}

}
