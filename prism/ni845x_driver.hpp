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
/// @brief Abstract interface to the NI-845x driver library
#ifndef NI845X_DRIVER_HPP__
#define NI845X_DRIVER_HPP__

#include "ni845x.hpp"
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <string>

namespace prism {

/// Abstract interface to the NI-845x C API.
/// One method per driver entry point used by Prism; every method returns the raw driver status.
/// Subclassed by the shared library binding and, in the unit tests, by a mock.
class Ni845xDriver : boost::noncopyable
{
public:
  virtual ~Ni845xDriver();

  /// Return the process wide driver instance.
  /// The library is loaded on first call only; the result (including failure) is cached for the process lifetime.
  /// @return empty pointer if the library or one of its entry points could not be loaded
  static boost::shared_ptr<Ni845xDriver> GetInstance();

  /// True if GetInstance() yields a usable driver
  static bool Available();

  /// Resolve the driver's own description of a status code
  std::string DescribeStatus(int32_t status);

  virtual int32_t FindDevice(char *first_device, NiHandle *find_handle, uint32_t *number_found) = 0;
  virtual int32_t FindDeviceNext(NiHandle find_handle, char *next_device) = 0;
  virtual int32_t CloseFindDeviceHandle(NiHandle find_handle) = 0;

  virtual int32_t Open(const char *resource_name, NiHandle *device_handle) = 0;
  virtual int32_t Close(NiHandle device_handle) = 0;
  virtual int32_t SetTimeout(NiHandle device_handle, uint32_t timeout_ms) = 0;
  virtual int32_t SetIoVoltageLevel(NiHandle device_handle, uint8_t voltage_level) = 0;

  virtual int32_t SpiConfigurationOpen(NiHandle *configuration_handle) = 0;
  virtual int32_t SpiConfigurationClose(NiHandle configuration_handle) = 0;
  virtual int32_t SpiConfigurationSetClockRate(NiHandle configuration_handle, uint16_t clock_rate_khz) = 0;
  virtual int32_t SpiConfigurationSetChipSelect(NiHandle configuration_handle, uint32_t chip_select) = 0;
  virtual int32_t SpiConfigurationSetPort(NiHandle configuration_handle, uint8_t port) = 0;
  virtual int32_t SpiConfigurationSetClockPolarity(NiHandle configuration_handle, int32_t polarity) = 0;
  virtual int32_t SpiConfigurationSetClockPhase(NiHandle configuration_handle, int32_t phase) = 0;
  virtual int32_t SpiConfigurationSetNumBitsPerSample(NiHandle configuration_handle, uint16_t bits) = 0;
  virtual int32_t SpiWriteRead(NiHandle device_handle, NiHandle configuration_handle,
                               uint32_t write_size, uint8_t *write_data,
                               uint32_t *read_size, uint8_t *read_data) = 0;

  virtual int32_t I2cConfigurationOpen(NiHandle *configuration_handle) = 0;
  virtual int32_t I2cConfigurationClose(NiHandle configuration_handle) = 0;
  virtual int32_t I2cConfigurationSetAddressSize(NiHandle configuration_handle, int32_t size) = 0;
  virtual int32_t I2cConfigurationSetAddress(NiHandle configuration_handle, uint16_t address) = 0;
  virtual int32_t I2cConfigurationSetClockRate(NiHandle configuration_handle, uint16_t clock_rate_khz) = 0;
  virtual int32_t I2cWrite(NiHandle device_handle, NiHandle configuration_handle,
                           uint32_t write_size, uint8_t *write_data) = 0;
  virtual int32_t I2cRead(NiHandle device_handle, NiHandle configuration_handle,
                          uint32_t num_bytes_to_read, uint32_t *read_size, uint8_t *read_data) = 0;

  virtual int32_t DioSetPortLineDirectionMap(NiHandle device_handle, uint8_t port, uint8_t direction_map) = 0;
  virtual int32_t DioWritePort(NiHandle device_handle, uint8_t port, uint8_t write_data) = 0;
  virtual int32_t DioReadPort(NiHandle device_handle, uint8_t port, uint8_t *read_data) = 0;

  virtual void StatusToString(int32_t status, uint32_t max_size, char *status_string) = 0;

protected:
  Ni845xDriver();
};

}

#endif // NI845X_DRIVER_HPP__
