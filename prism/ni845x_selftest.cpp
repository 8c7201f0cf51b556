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
#include "device_session.hpp"
#include "transfer_configuration.hpp"
#include "transfer_engine.hpp"
#include "ni845x_driver.hpp"
#include "settings.hpp"
#include "errors.hpp"
#include "misc.hpp"
#include "util.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/format.hpp>
#include <iostream>

using boost::shared_ptr;
using boost::format;
using std::cout;
using std::string;
using std::vector;
using namespace prism;

// Exercise one adapter end to end: SPI write-read, then DIO port 0 out and back in.
// Connect MOSI to MISO for the SPI data to come back unchanged.
int main(int argc, char* argv[])
{
  if (argc > 2) { fprintf(stderr, "Usage: %s [resource]\n", argv[0]); return 1; }

  Settings settings = Settings::FromEnvironment();
  shared_ptr<Ni845xDriver> driver = Ni845xDriver::GetInstance();
  if (!driver) { PR_ERROR("Unable to load the NI-845x driver (%s)\n", settings.driver_library.c_str()); return 1; }

  try {
    vector<string> devices = DeviceSession::Enumerate(driver);
    for (size_t n=0; n < devices.size(); n++) { cout << format("Found device %u: %s\n") % n % devices[n]; }

    string resource = argc > 1 ? argv[1] : string();
    if (resource.empty()) {
      if (devices.empty()) { PR_ERROR("No NI-845x devices found\n"); return 1; }
      resource = devices[0];
    }

    shared_ptr<DeviceSession> session = DeviceSession::Open(driver, resource);
    session->SetTimeout(settings.timeout_ms);
    session->SetIoVoltage(settings.io_voltage);
    cout << format("Opened %s, timeout %ums, IO voltage %u.%uV\n")
            % resource % session->timeout_ms() % (session->io_voltage() / 10) % (session->io_voltage() % 10);

    shared_ptr<SpiConfiguration> spi = session->CreateSpiConfiguration();
    spi->Apply(settings.spi);
    cout << format("SPI port %u chip select %u, %ukHz mode %d, %u bits\n")
            % (unsigned)spi->settings().port % spi->settings().chip_select % spi->settings().clock_rate_khz
            % (spi->settings().clock_polarity * 2 + spi->settings().clock_phase) % spi->settings().bits_per_sample;

    Bytes command = util::HexToBytes("DEADBEEF");
    Bytes response = TransferEngine::SpiWriteRead(*session, *spi, command);
    cout << format("SPI  %s --> %s\n") % util::BytesToHex(command) % util::BytesToHex(response);

    const uint8_t kDioPort = 0;
    const uint8_t kPattern = 0xaa;
    TransferEngine::DioSetDirection(*session, kDioPort, 0xff);
    TransferEngine::DioWrite(*session, kDioPort, kPattern);
    TransferEngine::DioSetDirection(*session, kDioPort, 0x00);
    uint8_t level = TransferEngine::DioRead(*session, kDioPort);
    cout << format("DIO  port %u wrote 0x%02x read 0x%02x\n") % (unsigned)kDioPort % (unsigned)kPattern % (unsigned)level;

    session->Close();
  } catch (const Error& e) {
    PR_ERROR("%s\n", e.what());
    if (e.status() != 0) { PR_ERROR("Driver status %d in %s\n", (int)e.status(), e.function().c_str()); }
    return 1;
  }
  return 0;
}
