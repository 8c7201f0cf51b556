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
/// @brief SPI and I2C configuration objects of the NI-845x driver
#ifndef TRANSFER_CONFIGURATION_HPP__
#define TRANSFER_CONFIGURATION_HPP__

#include "ni845x.hpp"
#include "settings.hpp"
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

namespace prism {

class Ni845xDriver;
class HandleGuard;

/// A driver side configuration object, owned through its own handle.
///
/// Configurations are created by DeviceSession and closed with it, but may also be closed on their own.
/// Setters write to the driver immediately and in any order; all of them must be applied
/// before the first transfer that relies on them, this is not checked.
/// Any use after Close() throws HandleClosedError.
class TransferConfiguration : boost::noncopyable
{
public:
  virtual ~TransferConfiguration();

  bool IsOpen() const;

  /// @throw HandleClosedError once closed
  NiHandle handle() const;

  /// Release the configuration handle; idempotent
  void Close();

protected:
  TransferConfiguration(boost::shared_ptr<Ni845xDriver> driver, boost::shared_ptr<HandleGuard> guard);

  boost::shared_ptr<Ni845xDriver> driver_;
  boost::shared_ptr<HandleGuard> guard_;
};

class SpiConfiguration : public TransferConfiguration
{
public:
  /// @throw TransferError if the driver cannot allocate a configuration
  static boost::shared_ptr<SpiConfiguration> Open(boost::shared_ptr<Ni845xDriver> driver);

  void SetClockRate(uint16_t clock_rate_khz);
  void SetChipSelect(uint32_t chip_select);
  void SetPort(uint8_t port);
  void SetClockPolarity(int32_t polarity);
  void SetClockPhase(int32_t phase);
  void SetNumBitsPerSample(uint16_t bits);

  /// Write every field of settings, port first
  void Apply(const SpiSettings& settings);

  /// Values last written through the setters; fields never written hold the SpiSettings defaults
  const SpiSettings& settings() const { return settings_; }

private:
  SpiConfiguration(boost::shared_ptr<Ni845xDriver> driver, boost::shared_ptr<HandleGuard> guard);

  SpiSettings settings_;
};

class I2cConfiguration : public TransferConfiguration
{
public:
  /// @throw TransferError if the driver cannot allocate a configuration
  static boost::shared_ptr<I2cConfiguration> Open(boost::shared_ptr<Ni845xDriver> driver);

  /// @param size kNi845xI2cAddress7Bit or kNi845xI2cAddress10Bit
  void SetAddressSize(int32_t size);
  void SetAddress(uint16_t address);
  void SetClockRate(uint16_t clock_rate_khz);

  void Apply(const I2cSettings& settings);

  const I2cSettings& settings() const { return settings_; }

private:
  I2cConfiguration(boost::shared_ptr<Ni845xDriver> driver, boost::shared_ptr<HandleGuard> guard);

  I2cSettings settings_;
};

}

#endif // TRANSFER_CONFIGURATION_HPP__
