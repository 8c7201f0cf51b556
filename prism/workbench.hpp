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
/// @brief Application state of the SPI workbench, independent of any user interface
#ifndef WORKBENCH_HPP__
#define WORKBENCH_HPP__

#include "hardware_backend.hpp"
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <string>
#include <vector>

namespace prism {

struct Settings;

/// One successful transfer, as upper case hex
struct HistoryEntry
{
  std::string command;
  std::string response;
};

/// Holds everything a front end displays: devices, selection, connection, simulation mode,
/// command history and the breakdown of the selected history item.
///
/// Operations that fail leave the state as it was, e.g. a failed transfer adds no history entry
/// and a failed connect keeps the device connected before, if any. The reason is available from last_error().
/// The history only grows; an entry's index never changes.
class Workbench : boost::noncopyable
{
public:
  typedef boost::function<boost::shared_ptr<HardwareBackend>(BackendKind)> backend_fcn_t;
  typedef boost::function<void()> change_fcn_t;

  /// @param initial Backend to start with; forced to kSimulatedBackend when driver_available is false
  /// @param factory Creates backends on start and on each change of simulation mode
  Workbench(BackendKind initial, bool driver_available, const backend_fcn_t& factory);
  ~Workbench();

  /// Workbench on the process wide driver, starting in HardwareBackend::DefaultKind()
  static boost::shared_ptr<Workbench> CreateInstance(const Settings& settings);

  void RefreshDevices();
  void SelectDevice(const std::string& resource);

  /// Open the selected device
  bool Connect();
  void Disconnect();

  /// Switch between simulated and real hardware, disconnecting first.
  /// @return false, with no change, when asked for real hardware without a driver
  bool SetSimulationMode(bool enabled);

  /// Transfer one command and record it in the history
  /// @return false if not connected, the hex is malformed or the transfer failed
  bool SendCommand(const std::string& command_hex);

  /// Send a CommandCatalog entry by label
  bool SendCatalogCommand(const std::string& label);

  /// Decode a history entry into breakdown_text()
  /// @return false if index is out of range; the text is then unchanged
  bool SelectHistoryItem(size_t index);

  /// Called after any observable state changed
  inline void RegisterChangeHandler(const change_fcn_t& handler) { change_fcn_ = handler; }

  const std::vector<std::string>& devices() const { return devices_; }
  const std::string& selected_device() const { return selected_device_; }
  bool connected() const { return connected_; }
  bool simulation_mode() const { return simulation_mode_; }
  bool driver_available() const { return driver_available_; }
  const std::vector<HistoryEntry>& history() const { return history_; }
  const std::string& breakdown_text() const { return breakdown_text_; }
  const std::string& last_error() const { return last_error_; }
  boost::shared_ptr<HardwareBackend> backend() const { return backend_; }

private:
  void Notify();

  backend_fcn_t factory_;
  change_fcn_t change_fcn_;
  boost::shared_ptr<HardwareBackend> backend_;
  bool driver_available_;
  bool simulation_mode_;
  bool connected_;
  std::vector<std::string> devices_;
  std::string selected_device_;
  std::vector<HistoryEntry> history_;
  std::string breakdown_text_;
  std::string last_error_;
};

}

#endif // WORKBENCH_HPP__
