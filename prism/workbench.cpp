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
#include "workbench.hpp"
#include "protocol_decoder.hpp"
#include "command_catalog.hpp"
#include "ni845x_driver.hpp"
#include "settings.hpp"
#include "misc.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/bind/bind.hpp>
#include <boost/format.hpp>

using boost::shared_ptr;
using boost::format;
using boost::placeholders::_1;
using std::string;

namespace prism {

Workbench::Workbench(BackendKind initial, bool driver_available, const backend_fcn_t& factory)
: factory_(factory),
  driver_available_(driver_available),
  simulation_mode_(initial == kSimulatedBackend || !driver_available),
  connected_(false)
{
  backend_ = factory_(simulation_mode_ ? kSimulatedBackend : kRealBackend);
  Misc::UserTraceSettings(backend_);
  RefreshDevices();
}

Workbench::~Workbench()
{
  if (connected_) { backend_->CloseDevice(); }
}

shared_ptr<Workbench> Workbench::CreateInstance(const Settings& settings)
{
  return shared_ptr<Workbench>(new Workbench(HardwareBackend::DefaultKind(settings), Ni845xDriver::Available(),
                                             boost::bind(&HardwareBackend::GetInstance, _1, settings)));
}

void Workbench::Notify()
{
  if (change_fcn_) { change_fcn_(); }
}

void Workbench::RefreshDevices()
{
  devices_ = backend_->FindDevices();
  last_error_ = backend_->last_error();
  selected_device_ = devices_.empty() ? string() : devices_[0];
  Notify();
}

void Workbench::SelectDevice(const string& resource)
{
  selected_device_ = resource;
  Notify();
}

bool Workbench::Connect()
{
  if (selected_device_.empty()) { last_error_ = "No device selected."; return false; }

  bool opened = backend_->OpenDevice(selected_device_);
  connected_ = backend_->IsOpen();
  last_error_ = backend_->last_error();
  Notify();
  return opened;
}

void Workbench::Disconnect()
{
  backend_->CloseDevice();
  last_error_ = backend_->last_error();
  connected_ = false;
  Notify();
}

bool Workbench::SetSimulationMode(bool enabled)
{
  if (!enabled && !driver_available_) {
    last_error_ = "NI-845x driver not found, cannot disable simulation mode.";
    PR_ERROR("Warning: %s\n", last_error_.c_str());
    return false;
  }
  if (enabled == simulation_mode_) { return true; }

  if (connected_) { Disconnect(); }
  simulation_mode_ = enabled;
  backend_ = factory_(enabled ? kSimulatedBackend : kRealBackend);
  Misc::UserTraceSettings(backend_);
  RefreshDevices();
  return true;
}

bool Workbench::SendCommand(const string& command_hex)
{
  if (!connected_) { last_error_ = "Cannot send command: no device connected."; return false; }

  string response_hex;
  if (!backend_->TransferHex(command_hex, response_hex)) {
    last_error_ = backend_->last_error();
    return false;
  }
  last_error_.clear();
  HistoryEntry entry = { boost::algorithm::to_upper_copy(command_hex), response_hex };
  history_.push_back(entry);
  Notify();
  return true;
}

bool Workbench::SendCatalogCommand(const string& label)
{
  const CatalogEntry *entry = CommandCatalog::Find(label.c_str());
  if (!entry) { last_error_ = str(format("Unknown catalog command '%s'") % label); return false; }
  return SendCommand(entry->hex);
}

bool Workbench::SelectHistoryItem(size_t index)
{
  if (index >= history_.size()) {
    last_error_ = str(format("No history entry %u") % index);
    return false;
  }
  const HistoryEntry& entry = history_[index];
  string command = ProtocolDecoder::Format(ProtocolDecoder::Decode(entry.command, kCommand));
  string response = ProtocolDecoder::Format(ProtocolDecoder::Decode(entry.response, kResponse));
  breakdown_text_ = str(format("--- Command ---\n%s\n\n--- Response ---\n%s") % command % response);
  Notify();
  return true;
}

}
