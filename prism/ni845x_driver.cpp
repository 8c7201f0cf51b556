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
#include "ni845x_driver.hpp"
#include "settings.hpp"
#include "misc.hpp"
#include <dlfcn.h>
#include <stdio.h>
#include <string.h>

using boost::shared_ptr;

namespace prism {

namespace {

template <typename F>
bool Resolve(void *library, const char *symbol, F& fcn)
{
  void *p = dlsym(library, symbol);
  if (!p) { PR_ERROR("ni845x: missing entry point %s\n", symbol); return false; }
  fcn = reinterpret_cast<F>(p);
  return true;
}

/// Binding to the vendor shared library, resolved with dlopen / dlsym.
class SharedLibraryDriver : public Ni845xDriver
{
public:
  SharedLibraryDriver();
  virtual ~SharedLibraryDriver();

  bool Load(const char *path);

  virtual int32_t FindDevice(char *first_device, NiHandle *find_handle, uint32_t *number_found)
  { return find_device_(first_device, find_handle, number_found); }
  virtual int32_t FindDeviceNext(NiHandle find_handle, char *next_device)
  { return find_device_next_(find_handle, next_device); }
  virtual int32_t CloseFindDeviceHandle(NiHandle find_handle)
  { return close_find_device_handle_(find_handle); }

  virtual int32_t Open(const char *resource_name, NiHandle *device_handle) { return open_(resource_name, device_handle); }
  virtual int32_t Close(NiHandle device_handle) { return close_(device_handle); }
  virtual int32_t SetTimeout(NiHandle device_handle, uint32_t timeout_ms) { return set_timeout_(device_handle, timeout_ms); }
  virtual int32_t SetIoVoltageLevel(NiHandle device_handle, uint8_t voltage_level)
  { return set_io_voltage_level_(device_handle, voltage_level); }

  virtual int32_t SpiConfigurationOpen(NiHandle *configuration_handle) { return spi_open_(configuration_handle); }
  virtual int32_t SpiConfigurationClose(NiHandle configuration_handle) { return spi_close_(configuration_handle); }
  virtual int32_t SpiConfigurationSetClockRate(NiHandle configuration_handle, uint16_t clock_rate_khz)
  { return spi_set_clock_rate_(configuration_handle, clock_rate_khz); }
  virtual int32_t SpiConfigurationSetChipSelect(NiHandle configuration_handle, uint32_t chip_select)
  { return spi_set_chip_select_(configuration_handle, chip_select); }
  virtual int32_t SpiConfigurationSetPort(NiHandle configuration_handle, uint8_t port)
  { return spi_set_port_(configuration_handle, port); }
  virtual int32_t SpiConfigurationSetClockPolarity(NiHandle configuration_handle, int32_t polarity)
  { return spi_set_clock_polarity_(configuration_handle, polarity); }
  virtual int32_t SpiConfigurationSetClockPhase(NiHandle configuration_handle, int32_t phase)
  { return spi_set_clock_phase_(configuration_handle, phase); }
  virtual int32_t SpiConfigurationSetNumBitsPerSample(NiHandle configuration_handle, uint16_t bits)
  { return spi_set_num_bits_per_sample_(configuration_handle, bits); }
  virtual int32_t SpiWriteRead(NiHandle device_handle, NiHandle configuration_handle,
                               uint32_t write_size, uint8_t *write_data,
                               uint32_t *read_size, uint8_t *read_data)
  { return spi_write_read_(device_handle, configuration_handle, write_size, write_data, read_size, read_data); }

  virtual int32_t I2cConfigurationOpen(NiHandle *configuration_handle) { return i2c_open_(configuration_handle); }
  virtual int32_t I2cConfigurationClose(NiHandle configuration_handle) { return i2c_close_(configuration_handle); }
  virtual int32_t I2cConfigurationSetAddressSize(NiHandle configuration_handle, int32_t size)
  { return i2c_set_address_size_(configuration_handle, size); }
  virtual int32_t I2cConfigurationSetAddress(NiHandle configuration_handle, uint16_t address)
  { return i2c_set_address_(configuration_handle, address); }
  virtual int32_t I2cConfigurationSetClockRate(NiHandle configuration_handle, uint16_t clock_rate_khz)
  { return i2c_set_clock_rate_(configuration_handle, clock_rate_khz); }
  virtual int32_t I2cWrite(NiHandle device_handle, NiHandle configuration_handle,
                           uint32_t write_size, uint8_t *write_data)
  { return i2c_write_(device_handle, configuration_handle, write_size, write_data); }
  virtual int32_t I2cRead(NiHandle device_handle, NiHandle configuration_handle,
                          uint32_t num_bytes_to_read, uint32_t *read_size, uint8_t *read_data)
  { return i2c_read_(device_handle, configuration_handle, num_bytes_to_read, read_size, read_data); }

  virtual int32_t DioSetPortLineDirectionMap(NiHandle device_handle, uint8_t port, uint8_t direction_map)
  { return dio_set_direction_(device_handle, port, direction_map); }
  virtual int32_t DioWritePort(NiHandle device_handle, uint8_t port, uint8_t write_data)
  { return dio_write_port_(device_handle, port, write_data); }
  virtual int32_t DioReadPort(NiHandle device_handle, uint8_t port, uint8_t *read_data)
  { return dio_read_port_(device_handle, port, read_data); }

  virtual void StatusToString(int32_t status, uint32_t max_size, char *status_string)
  { status_to_string_(status, max_size, status_string); }

private:
  void *library_;

  ni845xFindDevice_t find_device_;
  ni845xFindDeviceNext_t find_device_next_;
  ni845xCloseFindDeviceHandle_t close_find_device_handle_;
  ni845xOpen_t open_;
  ni845xClose_t close_;
  ni845xSetTimeout_t set_timeout_;
  ni845xSetIoVoltageLevel_t set_io_voltage_level_;
  ni845xStatusToString_t status_to_string_;

  ni845xConfigurationOpen_t spi_open_;
  ni845xConfigurationClose_t spi_close_;
  ni845xConfigurationSetU16_t spi_set_clock_rate_;
  ni845xConfigurationSetU32_t spi_set_chip_select_;
  ni845xConfigurationSetU8_t spi_set_port_;
  ni845xConfigurationSetI32_t spi_set_clock_polarity_;
  ni845xConfigurationSetI32_t spi_set_clock_phase_;
  ni845xConfigurationSetU16_t spi_set_num_bits_per_sample_;
  ni845xSpiWriteRead_t spi_write_read_;

  ni845xConfigurationOpen_t i2c_open_;
  ni845xConfigurationClose_t i2c_close_;
  ni845xConfigurationSetI32_t i2c_set_address_size_;
  ni845xConfigurationSetU16_t i2c_set_address_;
  ni845xConfigurationSetU16_t i2c_set_clock_rate_;
  ni845xI2cWrite_t i2c_write_;
  ni845xI2cRead_t i2c_read_;

  ni845xDioSetPortLineDirectionMap_t dio_set_direction_;
  ni845xDioWritePort_t dio_write_port_;
  ni845xDioReadPort_t dio_read_port_;
};

SharedLibraryDriver::SharedLibraryDriver()
: library_(NULL)
{
}

SharedLibraryDriver::~SharedLibraryDriver()
{
  if (library_) {
    dlclose(library_);
  }
}

bool SharedLibraryDriver::Load(const char *path)
{
  library_ = dlopen(path, RTLD_NOW | RTLD_LOCAL);
  if (!library_) {
    const char *why = dlerror();
    PR_ERROR("Warning: failed to load the NI-845x library %s: %s\n", path, why ? why : "unknown error");
    PR_ERROR("         This is expected if the NI-845x driver is not installed.\n");
    PR_ERROR("         Hardware access is disabled, only the simulated backend is available.\n");
    return false;
  }

  bool ok = true;
  ok = ok && Resolve(library_, "ni845xFindDevice", find_device_);
  ok = ok && Resolve(library_, "ni845xFindDeviceNext", find_device_next_);
  ok = ok && Resolve(library_, "ni845xCloseFindDeviceHandle", close_find_device_handle_);
  ok = ok && Resolve(library_, "ni845xOpen", open_);
  ok = ok && Resolve(library_, "ni845xClose", close_);
  ok = ok && Resolve(library_, "ni845xSetTimeout", set_timeout_);
  ok = ok && Resolve(library_, "ni845xSetIoVoltageLevel", set_io_voltage_level_);
  ok = ok && Resolve(library_, "ni845xStatusToString", status_to_string_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationOpen", spi_open_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationClose", spi_close_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetClockRate", spi_set_clock_rate_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetChipSelect", spi_set_chip_select_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetPort", spi_set_port_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetClockPolarity", spi_set_clock_polarity_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetClockPhase", spi_set_clock_phase_);
  ok = ok && Resolve(library_, "ni845xSpiConfigurationSetNumBitsPerSample", spi_set_num_bits_per_sample_);
  ok = ok && Resolve(library_, "ni845xSpiWriteRead", spi_write_read_);
  ok = ok && Resolve(library_, "ni845xI2cConfigurationOpen", i2c_open_);
  ok = ok && Resolve(library_, "ni845xI2cConfigurationClose", i2c_close_);
  ok = ok && Resolve(library_, "ni845xI2cConfigurationSetAddressSize", i2c_set_address_size_);
  ok = ok && Resolve(library_, "ni845xI2cConfigurationSetAddress", i2c_set_address_);
  ok = ok && Resolve(library_, "ni845xI2cConfigurationSetClockRate", i2c_set_clock_rate_);
  ok = ok && Resolve(library_, "ni845xI2cWrite", i2c_write_);
  ok = ok && Resolve(library_, "ni845xI2cRead", i2c_read_);
  ok = ok && Resolve(library_, "ni845xDioSetPortLineDirectionMap", dio_set_direction_);
  ok = ok && Resolve(library_, "ni845xDioWritePort", dio_write_port_);
  ok = ok && Resolve(library_, "ni845xDioReadPort", dio_read_port_);
  if (!ok) {
    PR_ERROR("Warning: %s is not a usable NI-845x library, hardware access is disabled.\n", path);
    dlclose(library_);
    library_ = NULL;
  }
  return ok;
}

shared_ptr<Ni845xDriver> LoadDriver()
{
  Settings settings = Settings::FromEnvironment();
  shared_ptr<SharedLibraryDriver> driver(new SharedLibraryDriver);
  if (!driver->Load(settings.driver_library.c_str())) { return shared_ptr<Ni845xDriver>(); }
  return driver;
}

}

Ni845xDriver::Ni845xDriver()
{
}

Ni845xDriver::~Ni845xDriver()
{
}

shared_ptr<Ni845xDriver> Ni845xDriver::GetInstance()
{
  static shared_ptr<Ni845xDriver> instance = LoadDriver();
  return instance;
}

bool Ni845xDriver::Available()
{
  return GetInstance().get() != NULL;
}

std::string Ni845xDriver::DescribeStatus(int32_t status)
{
  char buf[kNi845xStringSize] = "";
  StatusToString(status, sizeof(buf), buf);
  buf[sizeof(buf) - 1] = 0;
  if (strlen(buf)==0) { snprintf(buf, sizeof(buf), "Error code %d", (int)status); }
  return buf;
}

}
