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
/// @brief SPI, I2C and DIO operations on an open device
#ifndef TRANSFER_ENGINE_HPP__
#define TRANSFER_ENGINE_HPP__

#include "util.hpp"
#include <stdint.h>

namespace prism {

class DeviceSession;
class SpiConfiguration;
class I2cConfiguration;

/// Stateless set of driver transactions.
/// Every call blocks for at most the session timeout, is never retried, and throws
/// TransferError on a nonzero driver status or HandleClosedError on a closed session / configuration.
class TransferEngine
{
public:
  /// Full duplex SPI transfer.
  /// The read buffer is sized to the write length; the result holds as many bytes as the
  /// driver reports read, never more than that buffer.
  static Bytes SpiWriteRead(DeviceSession& session, SpiConfiguration& config, const Bytes& write_data);

  static void I2cWrite(DeviceSession& session, I2cConfiguration& config, const Bytes& write_data);
  static Bytes I2cRead(DeviceSession& session, I2cConfiguration& config, uint32_t count);

  /// @param direction_map one bit per line, 1 = output, 0 = input
  static void DioSetDirection(DeviceSession& session, uint8_t port, uint8_t direction_map);
  static void DioWrite(DeviceSession& session, uint8_t port, uint8_t values);
  static uint8_t DioRead(DeviceSession& session, uint8_t port);
};

}

#endif // TRANSFER_ENGINE_HPP__
