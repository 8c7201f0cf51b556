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
#include <gtest/gtest.h>

#include "settings.hpp"
#include "ni845x.hpp"
#include <stdlib.h>

using namespace prism;

namespace {

const char *kVariables[] = {
  "PRISM_NI845X_LIBRARY", "PRISM_SIMULATE", "PRISM_TIMEOUT_MS", "PRISM_IO_VOLTAGE",
  "PRISM_SPI_PORT", "PRISM_SPI_CHIP_SELECT", "PRISM_SPI_CLOCK_KHZ", "PRISM_SPI_POLARITY",
  "PRISM_SPI_PHASE", "PRISM_SPI_BITS", "PRISM_I2C_ADDRESS_SIZE", "PRISM_I2C_ADDRESS", "PRISM_I2C_CLOCK_KHZ",
};

class SettingsTest : public ::testing::Test
{
protected:
  virtual void SetUp() { Clear(); }
  virtual void TearDown() { Clear(); }

  void Clear()
  {
    for (size_t i=0; i < sizeof(kVariables) / sizeof(kVariables[0]); i++) { unsetenv(kVariables[i]); }
  }
};

}

TEST_F(SettingsTest, Defaults)
{
  Settings s = Settings::FromEnvironment();
  EXPECT_EQ(s.driver_library, "libni845x.so");
  EXPECT_FALSE(s.force_simulation);
  EXPECT_EQ(s.timeout_ms, 5000u);
  EXPECT_EQ(s.io_voltage, kNi845x33Volts);
  EXPECT_EQ(s.spi.clock_rate_khz, 1000);
  EXPECT_EQ(s.spi.bits_per_sample, 8);
}

TEST_F(SettingsTest, EnvironmentOverrides)
{
  setenv("PRISM_NI845X_LIBRARY", "/opt/ni/lib/libni845x.so", 1);
  setenv("PRISM_SIMULATE", "yes", 1);
  setenv("PRISM_TIMEOUT_MS", "250", 1);
  setenv("PRISM_IO_VOLTAGE", "18", 1);
  setenv("PRISM_SPI_CLOCK_KHZ", "0x200", 1);
  setenv("PRISM_SPI_POLARITY", "1", 1);
  setenv("PRISM_I2C_ADDRESS", "0x50", 1);

  Settings s = Settings::FromEnvironment();
  EXPECT_EQ(s.driver_library, "/opt/ni/lib/libni845x.so");
  EXPECT_TRUE(s.force_simulation);
  EXPECT_EQ(s.timeout_ms, 250u);
  EXPECT_EQ(s.io_voltage, kNi845x18Volts);
  EXPECT_EQ(s.spi.clock_rate_khz, 512);
  EXPECT_EQ(s.spi.clock_polarity, kNi845xSpiClockPolarityIdleHigh);
  EXPECT_EQ(s.i2c.address, 0x50);
}

TEST_F(SettingsTest, MalformedValuesKeepDefaults)
{
  setenv("PRISM_SIMULATE", "1", 1);
  setenv("PRISM_TIMEOUT_MS", "soon", 1);
  setenv("PRISM_SPI_PHASE", "2", 1);
  setenv("PRISM_SPI_BITS", "8bits", 1);

  Settings s = Settings::FromEnvironment();
  EXPECT_FALSE(s.force_simulation);
  EXPECT_EQ(s.timeout_ms, 5000u);
  EXPECT_EQ(s.spi.clock_phase, kNi845xSpiClockPhaseFirstEdge);
  EXPECT_EQ(s.spi.bits_per_sample, 8);
}
