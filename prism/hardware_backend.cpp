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
#include "hardware_backend.hpp"
#include "real_backend.hpp"
#include "simulated_backend.hpp"
#include "ni845x_driver.hpp"
#include "settings.hpp"
#include "misc.hpp"
#include <boost/chrono/system_clocks.hpp>
#include <boost/chrono/duration.hpp>

using boost::shared_ptr;
using boost::chrono::steady_clock;
using boost::chrono::microseconds;
using boost::chrono::duration_cast;

namespace prism {

const char *BackendKindName(BackendKind kind)
{
  switch (kind) {
    case kRealBackend: return "real";
    case kSimulatedBackend: return "simulated";
  }
  return "unknown";
}

shared_ptr<HardwareBackend> HardwareBackend::GetInstance(BackendKind kind, const Settings& settings)
{
  if (kind == kSimulatedBackend) {
    return shared_ptr<HardwareBackend>(new SimulatedBackend);
  }
  return shared_ptr<HardwareBackend>(new RealBackend(Ni845xDriver::GetInstance(), settings));
}

BackendKind HardwareBackend::DefaultKind(const Settings& settings)
{
  if (settings.force_simulation || !Ni845xDriver::Available()) { return kSimulatedBackend; }
  return kRealBackend;
}

HardwareBackend::HardwareBackend(BackendKind kind)
: kind_(kind),
  last_error_kind_(kNoError),
  trace_transfers_(false)
{
}

HardwareBackend::~HardwareBackend()
{
}

void HardwareBackend::RecordError(const Error& e)
{
  last_error_ = e.what();
  last_error_kind_ = e.kind();
}

void HardwareBackend::ClearError()
{
  last_error_.clear();
  last_error_kind_ = kNoError;
}

std::vector<std::string> HardwareBackend::FindDevices()
{
  try {
    std::vector<std::string> devices = DoFindDevices();
    ClearError();
    return devices;
  } catch (const Error& e) {
    RecordError(e);
    PR_ERROR("Error finding devices: %s\n", e.what());
  }
  return std::vector<std::string>();
}

bool HardwareBackend::OpenDevice(const std::string& resource)
{
  try {
    DoOpenDevice(resource);
  } catch (const Error& e) {
    RecordError(e);
    PR_ERROR("Error opening device %s: %s\n", resource.c_str(), e.what());
    return false;
  }
  ClearError();
  return true;
}

void HardwareBackend::CloseDevice()
{
  try {
    DoCloseDevice();
    ClearError();
  } catch (const Error& e) {
    RecordError(e);
    PR_ERROR("Error closing device: %s\n", e.what());
  }
}

bool HardwareBackend::Transfer(const Bytes& command, Bytes& response)
{
  steady_clock::time_point t0 = steady_clock::now();
  try {
    response = DoTransfer(command);
  } catch (const Error& e) {
    RecordError(e);
    if (trace_transfers_) { PR_ERROR("[T] %s --> %s\n", util::BytesToHex(command).c_str(), e.what()); }
    return false;
  }
  ClearError();
  if (trace_transfers_) {
    long us = (long)duration_cast<microseconds>(steady_clock::now() - t0).count();
    PR_ERROR("[T] %s --> %s (%ldus)\n", util::BytesToHex(command).c_str(), util::BytesToHex(response).c_str(), us);
  }
  return true;
}

bool HardwareBackend::TransferHex(const std::string& command_hex, std::string& response_hex)
{
  Bytes command;
  try {
    command = util::HexToBytes(command_hex);
  } catch (const InvalidHexError& e) {
    RecordError(e);
    return false;
  }
  Bytes response;
  if (!Transfer(command, response)) { return false; }
  response_hex = util::BytesToHex(response);
  return true;
}

}
