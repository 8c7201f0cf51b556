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
/// @brief Typed errors raised by the hardware layers and the decoder
#ifndef ERRORS_HPP__
#define ERRORS_HPP__

#include <stdint.h>
#include <stdexcept>
#include <string>

namespace prism {

class Ni845xDriver;

enum ErrorKind {
  kNoError = 0,
  kDriverUnavailable,   ///< Driver library not loaded
  kHandleClosed,        ///< Use of a released handle
  kDeviceOpen,          ///< ni845xOpen failed
  kTransfer,            ///< Any other nonzero driver status
  kInvalidHex,          ///< Malformed command text
  kConnection           ///< Transfer without an open device
};

const char *ErrorKindName(ErrorKind kind);

/// Base of every error Prism raises.
/// status() is the driver status code, 0 when the error did not come from the driver.
class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, const std::string& message, int32_t status=0, const std::string& function=std::string());
  virtual ~Error() throw();

  ErrorKind kind() const { return kind_; }
  int32_t status() const { return status_; }
  const std::string& function() const { return function_; }

private:
  ErrorKind kind_;
  int32_t status_;
  std::string function_;
};

class DriverUnavailableError : public Error
{
public:
  explicit DriverUnavailableError(const std::string& operation);
};

class HandleClosedError : public Error
{
public:
  explicit HandleClosedError(const std::string& handle_name);
};

class DeviceOpenError : public Error
{
public:
  DeviceOpenError(const std::string& resource, int32_t status, const std::string& driver_message);
};

class TransferError : public Error
{
public:
  TransferError(const std::string& function, int32_t status, const std::string& driver_message);
};

class InvalidHexError : public Error
{
public:
  InvalidHexError(const std::string& text, const std::string& reason);
};

class ConnectionError : public Error
{
public:
  explicit ConnectionError(const std::string& message);
};

/// Throw TransferError if status is nonzero, with the message resolved by the driver
void CheckStatus(Ni845xDriver& driver, int32_t status, const char *function);

}

#endif // ERRORS_HPP__
