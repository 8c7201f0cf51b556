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
/// @brief Types and constants of the NI-845x C API, as resolved from the driver library at runtime
#ifndef NI845X_HPP__
#define NI845X_HPP__

#include <stdint.h>

namespace prism {

/// Driver handle for devices, configurations and find sessions (64-bit build of the driver)
typedef uint64_t NiHandle;

const int32_t kNi845xErrorNoError = 0;

/// Largest resource name / status text the driver writes, including terminator
const unsigned kNi845xStringSize = 256;

// IO voltage level codes, in tenths of a volt
const uint8_t kNi845x33Volts = 33;
const uint8_t kNi845x25Volts = 25;
const uint8_t kNi845x18Volts = 18;
const uint8_t kNi845x15Volts = 15;
const uint8_t kNi845x12Volts = 12;

const int32_t kNi845xSpiClockPolarityIdleLow = 0;
const int32_t kNi845xSpiClockPolarityIdleHigh = 1;
const int32_t kNi845xSpiClockPhaseFirstEdge = 0;
const int32_t kNi845xSpiClockPhaseSecondEdge = 1;

const int32_t kNi845xI2cAddress7Bit = 0;
const int32_t kNi845xI2cAddress10Bit = 1;

// DIO line direction / level, one bit per line of an 8 bit port
const uint8_t kNi845xDioInput = 0;
const uint8_t kNi845xDioOutput = 1;
const uint8_t kNi845xDioLogicLow = 0;
const uint8_t kNi845xDioLogicHigh = 1;

}

extern "C" {

// Entry points looked up by name in the driver shared library.
typedef int32_t (*ni845xFindDevice_t)(char *first_device, prism::NiHandle *find_handle, uint32_t *number_found);
typedef int32_t (*ni845xFindDeviceNext_t)(prism::NiHandle find_handle, char *next_device);
typedef int32_t (*ni845xCloseFindDeviceHandle_t)(prism::NiHandle find_handle);
typedef int32_t (*ni845xOpen_t)(const char *resource_name, prism::NiHandle *device_handle);
typedef int32_t (*ni845xClose_t)(prism::NiHandle device_handle);
typedef int32_t (*ni845xSetTimeout_t)(prism::NiHandle device_handle, uint32_t timeout_ms);
typedef int32_t (*ni845xSetIoVoltageLevel_t)(prism::NiHandle device_handle, uint8_t voltage_level);
typedef void (*ni845xStatusToString_t)(int32_t status, uint32_t max_size, char *status_string);

typedef int32_t (*ni845xConfigurationOpen_t)(prism::NiHandle *configuration_handle);
typedef int32_t (*ni845xConfigurationClose_t)(prism::NiHandle configuration_handle);
typedef int32_t (*ni845xConfigurationSetU8_t)(prism::NiHandle configuration_handle, uint8_t value);
typedef int32_t (*ni845xConfigurationSetU16_t)(prism::NiHandle configuration_handle, uint16_t value);
typedef int32_t (*ni845xConfigurationSetU32_t)(prism::NiHandle configuration_handle, uint32_t value);
typedef int32_t (*ni845xConfigurationSetI32_t)(prism::NiHandle configuration_handle, int32_t value);

typedef int32_t (*ni845xSpiWriteRead_t)(prism::NiHandle device_handle, prism::NiHandle configuration_handle,
                                        uint32_t write_size, uint8_t *write_data,
                                        uint32_t *read_size, uint8_t *read_data);
typedef int32_t (*ni845xI2cWrite_t)(prism::NiHandle device_handle, prism::NiHandle configuration_handle,
                                    uint32_t write_size, uint8_t *write_data);
typedef int32_t (*ni845xI2cRead_t)(prism::NiHandle device_handle, prism::NiHandle configuration_handle,
                                   uint32_t num_bytes_to_read, uint32_t *read_size, uint8_t *read_data);

typedef int32_t (*ni845xDioSetPortLineDirectionMap_t)(prism::NiHandle device_handle, uint8_t port, uint8_t direction_map);
typedef int32_t (*ni845xDioWritePort_t)(prism::NiHandle device_handle, uint8_t port, uint8_t write_data);
typedef int32_t (*ni845xDioReadPort_t)(prism::NiHandle device_handle, uint8_t port, uint8_t *read_data);

}

#endif // NI845X_HPP__
