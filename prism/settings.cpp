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
#include "settings.hpp"
#include "ni845x.hpp"
#include "misc.hpp"
#include <stdlib.h>
#include <errno.h>
#include <string.h>

namespace prism {

namespace {

/// Overwrite value from the named environment variable if it holds a number in [lo, hi]
template <typename T>
void ReadNumber(const char *name, T& value, long lo, long hi)
{
  const char *p = getenv(name);
  if (!p || !*p) { return; }
  char *end = NULL;
  errno = 0;
  long v = strtol(p, &end, 0);
  if (errno != 0 || *end != 0 || v < lo || v > hi) {
    PR_ERROR("Ignoring %s=%s: expected a number in %ld..%ld\n", name, p, lo, hi);
    return;
  }
  value = static_cast<T>(v);
}

bool ReadFlag(const char *name)
{
  const char *p = getenv(name);
  return p && strcmp(p, "yes")==0;
}

}

SpiSettings::SpiSettings()
: port(0),
  chip_select(0),
  clock_rate_khz(1000),
  clock_polarity(kNi845xSpiClockPolarityIdleLow),
  clock_phase(kNi845xSpiClockPhaseFirstEdge),
  bits_per_sample(8)
{
}

I2cSettings::I2cSettings()
: address_size(kNi845xI2cAddress7Bit),
  address(0),
  clock_rate_khz(100)
{
}

Settings::Settings()
: driver_library("libni845x.so"),
  force_simulation(false),
  timeout_ms(5000),
  io_voltage(kNi845x33Volts)
{
}

Settings Settings::FromEnvironment()
{
  Settings s;
  const char *p = getenv("PRISM_NI845X_LIBRARY");
  if (p && *p) { s.driver_library = p; }
  s.force_simulation = ReadFlag("PRISM_SIMULATE");
  ReadNumber("PRISM_TIMEOUT_MS", s.timeout_ms, 0, 0x7fffffffL);
  ReadNumber("PRISM_IO_VOLTAGE", s.io_voltage, 0, 0xff);
  ReadNumber("PRISM_SPI_PORT", s.spi.port, 0, 0xff);
  ReadNumber("PRISM_SPI_CHIP_SELECT", s.spi.chip_select, 0, 0x7fffffffL);
  ReadNumber("PRISM_SPI_CLOCK_KHZ", s.spi.clock_rate_khz, 1, 0xffff);
  ReadNumber("PRISM_SPI_POLARITY", s.spi.clock_polarity, 0, 1);
  ReadNumber("PRISM_SPI_PHASE", s.spi.clock_phase, 0, 1);
  ReadNumber("PRISM_SPI_BITS", s.spi.bits_per_sample, 1, 0xffff);
  ReadNumber("PRISM_I2C_ADDRESS_SIZE", s.i2c.address_size, 0, 1);
  ReadNumber("PRISM_I2C_ADDRESS", s.i2c.address, 0, 0x3ff);
  ReadNumber("PRISM_I2C_CLOCK_KHZ", s.i2c.clock_rate_khz, 1, 0xffff);
  return s;
}

}
