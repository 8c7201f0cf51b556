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
#include "transfer_engine.hpp"
#include "device_session.hpp"
#include "transfer_configuration.hpp"
#include "ni845x_driver.hpp"
#include "errors.hpp"

namespace prism {

Bytes TransferEngine::SpiWriteRead(DeviceSession& session, SpiConfiguration& config, const Bytes& write_data)
{
  Ni845xDriver& driver = *session.driver();
  NiHandle device = session.handle();
  NiHandle configuration = config.handle();

  // The driver takes a non-const write buffer
  Bytes write_buffer(write_data);
  Bytes read_buffer(write_data.size());
  uint32_t read_size = write_data.size();

  int32_t status = driver.SpiWriteRead(device, configuration, write_buffer.size(),
                                       write_buffer.empty() ? NULL : &write_buffer[0],
                                       &read_size,
                                       read_buffer.empty() ? NULL : &read_buffer[0]);
  CheckStatus(driver, status, "ni845xSpiWriteRead");

  if (read_size < read_buffer.size()) { read_buffer.resize(read_size); }
  return read_buffer;
}

void TransferEngine::I2cWrite(DeviceSession& session, I2cConfiguration& config, const Bytes& write_data)
{
  Ni845xDriver& driver = *session.driver();
  NiHandle device = session.handle();
  NiHandle configuration = config.handle();

  Bytes write_buffer(write_data);
  int32_t status = driver.I2cWrite(device, configuration, write_buffer.size(),
                                   write_buffer.empty() ? NULL : &write_buffer[0]);
  CheckStatus(driver, status, "ni845xI2cWrite");
}

Bytes TransferEngine::I2cRead(DeviceSession& session, I2cConfiguration& config, uint32_t count)
{
  Ni845xDriver& driver = *session.driver();
  NiHandle device = session.handle();
  NiHandle configuration = config.handle();

  Bytes read_buffer(count);
  uint32_t read_size = 0;
  int32_t status = driver.I2cRead(device, configuration, count, &read_size,
                                  read_buffer.empty() ? NULL : &read_buffer[0]);
  CheckStatus(driver, status, "ni845xI2cRead");

  if (read_size < read_buffer.size()) { read_buffer.resize(read_size); }
  return read_buffer;
}

void TransferEngine::DioSetDirection(DeviceSession& session, uint8_t port, uint8_t direction_map)
{
  Ni845xDriver& driver = *session.driver();
  CheckStatus(driver, driver.DioSetPortLineDirectionMap(session.handle(), port, direction_map),
              "ni845xDioSetPortLineDirectionMap");
}

void TransferEngine::DioWrite(DeviceSession& session, uint8_t port, uint8_t values)
{
  Ni845xDriver& driver = *session.driver();
  CheckStatus(driver, driver.DioWritePort(session.handle(), port, values), "ni845xDioWritePort");
}

uint8_t TransferEngine::DioRead(DeviceSession& session, uint8_t port)
{
  Ni845xDriver& driver = *session.driver();
  uint8_t value = 0;
  CheckStatus(driver, driver.DioReadPort(session.handle(), port, &value), "ni845xDioReadPort");
  return value;
}

}
