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
#include "errors.hpp"
#include "ni845x_driver.hpp"
#include <boost/format.hpp>

using boost::format;

namespace prism {

const char *ErrorKindName(ErrorKind kind)
{
  switch (kind) {
    case kNoError: return "no error";
    case kDriverUnavailable: return "driver unavailable";
    case kHandleClosed: return "handle closed";
    case kDeviceOpen: return "device open error";
    case kTransfer: return "transfer error";
    case kInvalidHex: return "invalid hex";
    case kConnection: return "connection error";
  }
  return "unknown error";
}

Error::Error(ErrorKind kind, const std::string& message, int32_t status, const std::string& function)
: std::runtime_error(message),
  kind_(kind),
  status_(status),
  function_(function)
{
}

Error::~Error() throw()
{
}

DriverUnavailableError::DriverUnavailableError(const std::string& operation)
: Error(kDriverUnavailable, str(format("Cannot %s: NI-845x driver not loaded") % operation))
{
}

HandleClosedError::HandleClosedError(const std::string& handle_name)
: Error(kHandleClosed, str(format("%s handle is closed") % handle_name))
{
}

DeviceOpenError::DeviceOpenError(const std::string& resource, int32_t status, const std::string& driver_message)
: Error(kDeviceOpen, str(format("Error opening device %s: %s (Code: %d)") % resource % driver_message % status),
        status, "ni845xOpen")
{
}

TransferError::TransferError(const std::string& function, int32_t status, const std::string& driver_message)
: Error(kTransfer, str(format("Error in %s: %s (Code: %d)") % function % driver_message % status), status, function)
{
}

InvalidHexError::InvalidHexError(const std::string& text, const std::string& reason)
: Error(kInvalidHex, str(format("Invalid hex string '%s': %s") % text % reason))
{
}

ConnectionError::ConnectionError(const std::string& message)
: Error(kConnection, message)
{
}

void CheckStatus(Ni845xDriver& driver, int32_t status, const char *function)
{
  if (status != kNi845xErrorNoError) {
    throw TransferError(function, status, driver.DescribeStatus(status));
  }
}

}
