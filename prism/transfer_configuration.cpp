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
#include "transfer_configuration.hpp"
#include "ni845x_driver.hpp"
#include "handle_guard.hpp"
#include "errors.hpp"
#include <boost/bind/bind.hpp>

using boost::shared_ptr;
using boost::placeholders::_1;

namespace prism {

TransferConfiguration::TransferConfiguration(shared_ptr<Ni845xDriver> driver, shared_ptr<HandleGuard> guard)
: driver_(driver),
  guard_(guard)
{
}

TransferConfiguration::~TransferConfiguration()
{
}

bool TransferConfiguration::IsOpen() const
{
  return guard_->IsOpen();
}

NiHandle TransferConfiguration::handle() const
{
  return guard_->handle();
}

void TransferConfiguration::Close()
{
  guard_->Release();
}

// --- SPI ---

SpiConfiguration::SpiConfiguration(shared_ptr<Ni845xDriver> driver, shared_ptr<HandleGuard> guard)
: TransferConfiguration(driver, guard)
{
}

shared_ptr<SpiConfiguration> SpiConfiguration::Open(shared_ptr<Ni845xDriver> driver)
{
  shared_ptr<HandleGuard> guard = HandleGuard::Acquire(driver, "SPI configuration",
      boost::bind(&Ni845xDriver::SpiConfigurationOpen, driver.get(), _1), "ni845xSpiConfigurationOpen",
      boost::bind(&Ni845xDriver::SpiConfigurationClose, driver.get(), _1), "ni845xSpiConfigurationClose");
  return shared_ptr<SpiConfiguration>(new SpiConfiguration(driver, guard));
}

void SpiConfiguration::SetClockRate(uint16_t clock_rate_khz)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetClockRate(handle(), clock_rate_khz),
              "ni845xSpiConfigurationSetClockRate");
  settings_.clock_rate_khz = clock_rate_khz;
}

void SpiConfiguration::SetChipSelect(uint32_t chip_select)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetChipSelect(handle(), chip_select),
              "ni845xSpiConfigurationSetChipSelect");
  settings_.chip_select = chip_select;
}

void SpiConfiguration::SetPort(uint8_t port)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetPort(handle(), port), "ni845xSpiConfigurationSetPort");
  settings_.port = port;
}

void SpiConfiguration::SetClockPolarity(int32_t polarity)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetClockPolarity(handle(), polarity),
              "ni845xSpiConfigurationSetClockPolarity");
  settings_.clock_polarity = polarity;
}

void SpiConfiguration::SetClockPhase(int32_t phase)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetClockPhase(handle(), phase),
              "ni845xSpiConfigurationSetClockPhase");
  settings_.clock_phase = phase;
}

void SpiConfiguration::SetNumBitsPerSample(uint16_t bits)
{
  CheckStatus(*driver_, driver_->SpiConfigurationSetNumBitsPerSample(handle(), bits),
              "ni845xSpiConfigurationSetNumBitsPerSample");
  settings_.bits_per_sample = bits;
}

void SpiConfiguration::Apply(const SpiSettings& settings)
{
  SetPort(settings.port);
  SetChipSelect(settings.chip_select);
  SetClockRate(settings.clock_rate_khz);
  SetClockPolarity(settings.clock_polarity);
  SetClockPhase(settings.clock_phase);
  SetNumBitsPerSample(settings.bits_per_sample);
}

// --- I2C ---

I2cConfiguration::I2cConfiguration(shared_ptr<Ni845xDriver> driver, shared_ptr<HandleGuard> guard)
: TransferConfiguration(driver, guard)
{
}

shared_ptr<I2cConfiguration> I2cConfiguration::Open(shared_ptr<Ni845xDriver> driver)
{
  shared_ptr<HandleGuard> guard = HandleGuard::Acquire(driver, "I2C configuration",
      boost::bind(&Ni845xDriver::I2cConfigurationOpen, driver.get(), _1), "ni845xI2cConfigurationOpen",
      boost::bind(&Ni845xDriver::I2cConfigurationClose, driver.get(), _1), "ni845xI2cConfigurationClose");
  return shared_ptr<I2cConfiguration>(new I2cConfiguration(driver, guard));
}

void I2cConfiguration::SetAddressSize(int32_t size)
{
  CheckStatus(*driver_, driver_->I2cConfigurationSetAddressSize(handle(), size),
              "ni845xI2cConfigurationSetAddressSize");
  settings_.address_size = size;
}

void I2cConfiguration::SetAddress(uint16_t address)
{
  CheckStatus(*driver_, driver_->I2cConfigurationSetAddress(handle(), address), "ni845xI2cConfigurationSetAddress");
  settings_.address = address;
}

void I2cConfiguration::SetClockRate(uint16_t clock_rate_khz)
{
  CheckStatus(*driver_, driver_->I2cConfigurationSetClockRate(handle(), clock_rate_khz),
              "ni845xI2cConfigurationSetClockRate");
  settings_.clock_rate_khz = clock_rate_khz;
}

void I2cConfiguration::Apply(const I2cSettings& settings)
{
  SetAddressSize(settings.address_size);
  SetAddress(settings.address);
  SetClockRate(settings.clock_rate_khz);
}

}
