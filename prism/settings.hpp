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
/// @brief Runtime settings, read from the environment
#ifndef SETTINGS_HPP__
#define SETTINGS_HPP__

#include <stdint.h>
#include <string>

namespace prism {

/// SPI parameters applied to the configuration the real backend creates before its first transfer
struct SpiSettings
{
  uint8_t port;
  uint32_t chip_select;
  uint16_t clock_rate_khz;
  int32_t clock_polarity;
  int32_t clock_phase;
  uint16_t bits_per_sample;

  SpiSettings();
};

/// I2C parameters; only used by callers creating their own I2cConfiguration
struct I2cSettings
{
  int32_t address_size;
  uint16_t address;
  uint16_t clock_rate_khz;

  I2cSettings();
};

/// All user adjustable settings.
/// Defaults match the vendor example configuration: 5 s timeout, 3.3 V, SPI mode 0 at 1 MHz, 8 bits.
struct Settings
{
  std::string driver_library;   ///< Shared library name or path passed to dlopen
  bool force_simulation;        ///< Use the simulated backend even if the driver is present
  uint32_t timeout_ms;
  uint8_t io_voltage;           ///< kNi845x33Volts etc.
  SpiSettings spi;
  I2cSettings i2c;

  Settings();

  /// Defaults overridden by PRISM_* environment variables.
  /// Malformed values are reported and the default kept.
  static Settings FromEnvironment();
};

}

#endif // SETTINGS_HPP__
