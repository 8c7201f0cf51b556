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
#include "command_catalog.hpp"
#include "settings.hpp"
#include "misc.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/format.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <iostream>
#include <stdlib.h>
#include <string.h>

using boost::shared_ptr;
using boost::format;
using std::cout;
using std::string;

using namespace prism;

namespace {

void Help()
{
  cout << "Commands:\n"
          "  devices          list devices (refresh)\n"
          "  select <n|name>  select a device by index or resource name\n"
          "  connect          open the selected device\n"
          "  disconnect       close the device\n"
          "  send <hex>       transfer a command, e.g. send 0100\n"
          "  catalog [name]   list the predefined commands, or send one\n"
          "  history          list transfers\n"
          "  show <n>         breakdown of history entry n\n"
          "  sim on|off       switch simulation mode\n"
          "  quit\n";
}

void Status(const Workbench& bench)
{
  cout << format("[%s] %s %s\n") % (bench.simulation_mode() ? "SIM" : "HW")
          % (bench.selected_device().empty() ? "(no device)" : bench.selected_device())
          % (bench.connected() ? "connected" : "disconnected");
}

void Failed(const Workbench& bench, const char *what)
{
  PR_ERROR("%s failed: %s\n", what, bench.last_error().empty() ? "unknown error" : bench.last_error().c_str());
}

void Devices(const Workbench& bench)
{
  if (bench.devices().empty()) { cout << "No devices found\n"; return; }
  for (size_t n=0; n < bench.devices().size(); n++) {
    cout << format("%c%u: %s\n") % (bench.devices()[n] == bench.selected_device() ? '*' : ' ') % n % bench.devices()[n];
  }
}

void Select(Workbench& bench, const string& arg)
{
  char *end = NULL;
  unsigned long n = strtoul(arg.c_str(), &end, 10);
  if (!arg.empty() && *end == 0) {
    if (n >= bench.devices().size()) { PR_ERROR("No device %lu\n", n); return; }
    bench.SelectDevice(bench.devices()[n]);
  } else {
    bench.SelectDevice(arg);
  }
}

void Catalog(Workbench& bench, const string& arg)
{
  if (arg.empty()) {
    size_t count = 0;
    const CatalogEntry *entries = CommandCatalog::Builtin(count);
    for (size_t n=0; n < count; n++) { cout << format("  %-14s %s\n") % entries[n].label % entries[n].hex; }
    return;
  }
  if (!bench.SendCatalogCommand(arg)) { Failed(bench, "catalog"); return; }
  cout << format("%s --> %s\n") % bench.history().back().command % bench.history().back().response;
}

void History(const Workbench& bench)
{
  for (size_t n=0; n < bench.history().size(); n++) {
    cout << format("%3u: %s --> %s\n") % n % bench.history()[n].command % bench.history()[n].response;
  }
}

}

int main(int argc, char* argv[])
{
  Settings settings = Settings::FromEnvironment();
  for (int i=1; i < argc; i++) {
    if (strcmp(argv[i], "--simulate")==0) { settings.force_simulation = true; }
    else if (strcmp(argv[i], "--real")==0) { settings.force_simulation = false; }
    else { fprintf(stderr, "Usage: %s [--simulate|--real]\n", argv[0]); return 1; }
  }

  shared_ptr<Workbench> bench = Workbench::CreateInstance(settings);
  Status(*bench);
  Devices(*bench);

  string line;
  while (cout << "> " << std::flush, std::getline(std::cin, line)) {
    boost::algorithm::trim(line);
    if (line.empty()) { continue; }
    size_t space = line.find(' ');
    string cmd = line.substr(0, space);
    string arg = space == string::npos ? string() : boost::algorithm::trim_copy(line.substr(space + 1));

    if (cmd == "quit" || cmd == "exit") { break; }
    else if (cmd == "help") { Help(); }
    else if (cmd == "devices") { bench->RefreshDevices(); Devices(*bench); }
    else if (cmd == "select") { Select(*bench, arg); Status(*bench); }
    else if (cmd == "connect") { if (!bench->Connect()) { Failed(*bench, "connect"); } Status(*bench); }
    else if (cmd == "disconnect") { bench->Disconnect(); Status(*bench); }
    else if (cmd == "send") {
      if (!bench->SendCommand(arg)) { Failed(*bench, "send"); continue; }
      cout << format("%s --> %s\n") % bench->history().back().command % bench->history().back().response;
    }
    else if (cmd == "catalog") { Catalog(*bench, arg); }
    else if (cmd == "history") { History(*bench); }
    else if (cmd == "show") {
      char *end = NULL;
      unsigned long n = strtoul(arg.c_str(), &end, 10);
      if (arg.empty() || *end != 0 || !bench->SelectHistoryItem(n)) { PR_ERROR("No history entry '%s'\n", arg.c_str()); continue; }
      cout << bench->breakdown_text() << "\n";
    }
    else if (cmd == "sim") {
      if (arg != "on" && arg != "off") { PR_ERROR("Usage: sim on|off\n"); continue; }
      if (!bench->SetSimulationMode(arg == "on")) { Failed(*bench, "sim"); }
      Status(*bench);
      Devices(*bench);
    }
    else { PR_ERROR("Unknown command '%s', try help\n", cmd.c_str()); }
  }
  if (bench->connected()) { bench->Disconnect(); }
  return 0;
}
