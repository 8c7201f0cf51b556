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
#include "real_backend.hpp"
#include "device_session.hpp"
#include "transfer_configuration.hpp"
#include "transfer_engine.hpp"
#include "ni845x_driver.hpp"
#include "misc.hpp"

using boost::shared_ptr;

namespace prism {

RealBackend::RealBackend(shared_ptr<Ni845xDriver> driver, const Settings& settings)
: HardwareBackend(kRealBackend),
  driver_(driver),
  settings_(settings)
{
}

RealBackend::~RealBackend()
{
  CloseDevice();
}

bool RealBackend::IsOpen() const
{
  return session_ && session_->IsOpen();
}

std::vector<std::string> RealBackend::DoFindDevices()
{
  return DeviceSession::Enumerate(driver_);
}

void RealBackend::DoOpenDevice(const std::string& resource)
{
  // The current session stays in use until the new one is fully set up
  shared_ptr<DeviceSession> session = DeviceSession::Open(driver_, resource);
  session->SetTimeout(settings_.timeout_ms);
  session->SetIoVoltage(settings_.io_voltage);

  if (session_) {
    std::string previous = session_->resource();
    try {
      DoCloseDevice();
    } catch (const Error& e) {
      PR_ERROR("Closing %s: %s\n", previous.c_str(), e.what());
    }
  }
  session_ = session;
  printf("Successfully opened device: %s\n", resource.c_str());
}

void RealBackend::DoCloseDevice()
{
  shared_ptr<DeviceSession> session = session_;
  spi_config_.reset();
  session_.reset();
  if (session) { session->Close(); }
}

Bytes RealBackend::DoTransfer(const Bytes& command)
{
  if (!session_) { throw ConnectionError("No device is currently open."); }

  if (!spi_config_) {
    shared_ptr<SpiConfiguration> config = session_->CreateSpiConfiguration();
    try {
      config->Apply(settings_.spi);
    } catch (const Error&) {
      try {
        config->Close();
      } catch (const Error& e) {
        PR_ERROR("Releasing SPI configuration: %s\n", e.what());
      }
      throw;
    }
    spi_config_ = config;
  }
  return TransferEngine::SpiWriteRead(*session_, *spi_config_, command);
}

}
