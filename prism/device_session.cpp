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
#include "device_session.hpp"
#include "ni845x_driver.hpp"
#include "handle_guard.hpp"
#include "transfer_configuration.hpp"
#include "errors.hpp"
#include "misc.hpp"
#include <boost/bind/bind.hpp>
#include <algorithm>

using boost::shared_ptr;
using boost::placeholders::_1;
using std::string;
using std::vector;

namespace prism {

namespace {

bool IsClosed(const shared_ptr<TransferConfiguration>& config)
{
  return !config->IsOpen();
}

}

vector<string> DeviceSession::Enumerate(shared_ptr<Ni845xDriver> driver)
{
  vector<string> devices;
  if (!driver) { return devices; }

  char first[kNi845xStringSize] = "";
  uint32_t found = 0;
  shared_ptr<HandleGuard> find = HandleGuard::Acquire(driver, "find device",
      boost::bind(&Ni845xDriver::FindDevice, driver.get(), &first[0], _1, &found), "ni845xFindDevice",
      boost::bind(&Ni845xDriver::CloseFindDeviceHandle, driver.get(), _1), "ni845xCloseFindDeviceHandle");

  if (found > 0) {
    first[sizeof(first) - 1] = 0;
    devices.push_back(first);
  }
  for (uint32_t n=1; n < found; n++) {
    char next[kNi845xStringSize] = "";
    CheckStatus(*driver, driver->FindDeviceNext(find->handle(), next), "ni845xFindDeviceNext");
    next[sizeof(next) - 1] = 0;
    devices.push_back(next);
  }
  find->Release();
  return devices;
}

shared_ptr<DeviceSession> DeviceSession::Open(shared_ptr<Ni845xDriver> driver, const string& resource)
{
  if (!driver) { throw DriverUnavailableError("open device " + resource); }

  shared_ptr<HandleGuard> guard;
  try {
    guard = HandleGuard::Acquire(driver, "device " + resource,
        boost::bind(&Ni845xDriver::Open, driver.get(), resource.c_str(), _1), "ni845xOpen",
        boost::bind(&Ni845xDriver::Close, driver.get(), _1), "ni845xClose");
  } catch (const TransferError& e) {
    throw DeviceOpenError(resource, e.status(), driver->DescribeStatus(e.status()));
  }
  return shared_ptr<DeviceSession>(new DeviceSession(driver, resource, guard));
}

DeviceSession::DeviceSession(shared_ptr<Ni845xDriver> driver, const string& resource, shared_ptr<HandleGuard> guard)
: driver_(driver),
  resource_(resource),
  guard_(guard),
  timeout_ms_(0),
  io_voltage_(0)
{
}

DeviceSession::~DeviceSession()
{
  try {
    Close();
  } catch (const Error& e) {
    PR_ERROR("Closing %s: %s\n", resource_.c_str(), e.what());
  }
}

bool DeviceSession::IsOpen() const
{
  return guard_->IsOpen();
}

NiHandle DeviceSession::handle() const
{
  return guard_->handle();
}

void DeviceSession::SetTimeout(uint32_t timeout_ms)
{
  CheckStatus(*driver_, driver_->SetTimeout(handle(), timeout_ms), "ni845xSetTimeout");
  timeout_ms_ = timeout_ms;
}

void DeviceSession::SetIoVoltage(uint8_t voltage_code)
{
  CheckStatus(*driver_, driver_->SetIoVoltageLevel(handle(), voltage_code), "ni845xSetIoVoltageLevel");
  io_voltage_ = voltage_code;
}

shared_ptr<SpiConfiguration> DeviceSession::CreateSpiConfiguration()
{
  if (!IsOpen()) { throw HandleClosedError(guard_->description()); }
  shared_ptr<SpiConfiguration> config = SpiConfiguration::Open(driver_);
  Track(config);
  return config;
}

shared_ptr<I2cConfiguration> DeviceSession::CreateI2cConfiguration()
{
  if (!IsOpen()) { throw HandleClosedError(guard_->description()); }
  shared_ptr<I2cConfiguration> config = I2cConfiguration::Open(driver_);
  Track(config);
  return config;
}

void DeviceSession::Track(shared_ptr<TransferConfiguration> config)
{
  configurations_.erase(std::remove_if(configurations_.begin(), configurations_.end(), IsClosed),
                        configurations_.end());
  configurations_.push_back(config);
}

size_t DeviceSession::configuration_count() const
{
  return configurations_.size() - std::count_if(configurations_.begin(), configurations_.end(), IsClosed);
}

void DeviceSession::Close()
{
  shared_ptr<TransferError> first_error;
  for (size_t n=0; n < configurations_.size(); n++) {
    try {
      configurations_[n]->Close();
    } catch (const TransferError& e) {
      if (!first_error) { first_error.reset(new TransferError(e)); }
    }
  }
  configurations_.clear();
  try {
    guard_->Release();
  } catch (const TransferError& e) {
    if (!first_error) { first_error.reset(new TransferError(e)); }
  }
  if (first_error) { throw *first_error; }
}

}
