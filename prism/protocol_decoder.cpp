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
#include "protocol_decoder.hpp"
#include <boost/format.hpp>
#include <algorithm>
#include <sstream>

using boost::format;

namespace prism {

namespace {

// Serial flash style commands; key is the first command byte
const FieldSpec kReadStatusCommand[] = { { "Command", 1 }, { "Dummy Byte", 1 } };
const FieldSpec kReadStatusResponse[] = { { "Status", 1 }, { "Dummy Byte", 1 } };
const FieldSpec kSingleByteCommand[] = { { "Command", 1 } };
const FieldSpec kAllData[] = { { "Data", kRemainder } };

const CommandDefinition kDefinitions[] = {
  { 0x01, "Read Status Register",
    kReadStatusCommand, sizeof(kReadStatusCommand) / sizeof(kReadStatusCommand[0]),
    kReadStatusResponse, sizeof(kReadStatusResponse) / sizeof(kReadStatusResponse[0]) },
  { 0x06, "Write Enable",
    kSingleByteCommand, sizeof(kSingleByteCommand) / sizeof(kSingleByteCommand[0]),
    NULL, 0 },
  { 0xC7, "Chip Erase",
    kSingleByteCommand, sizeof(kSingleByteCommand) / sizeof(kSingleByteCommand[0]),
    NULL, 0 },
};

const CommandDefinition kDefaultDefinition = {
  -1, "Unknown Command",
  kAllData, sizeof(kAllData) / sizeof(kAllData[0]),
  kAllData, sizeof(kAllData) / sizeof(kAllData[0])
};

const size_t kDefinitionCount = sizeof(kDefinitions) / sizeof(kDefinitions[0]);

const char *DirectionName(Direction d)
{
  return d == kCommand ? "Command" : "Response";
}

std::string Slice(const Bytes& data, size_t from, size_t length)
{
  return util::BytesToHex(Bytes(data.begin() + from, data.begin() + from + length));
}

}

size_t Breakdown::consumed() const
{
  size_t n = 0;
  for (size_t i=0; i < fields.size(); i++) {
    if (!fields[i].unparsed) { n += fields[i].length; }
  }
  return n;
}

const CommandDefinition& ProtocolDecoder::Lookup(uint8_t opcode)
{
  for (size_t i=0; i < kDefinitionCount; i++) {
    if (kDefinitions[i].opcode == opcode) { return kDefinitions[i]; }
  }
  return kDefaultDefinition;
}

const CommandDefinition& ProtocolDecoder::DefaultDefinition()
{
  return kDefaultDefinition;
}

const CommandDefinition *ProtocolDecoder::Definitions(size_t& count)
{
  count = kDefinitionCount;
  return kDefinitions;
}

bool ProtocolDecoder::IsValidDefinition(const CommandDefinition& definition)
{
  const Direction directions[] = { kCommand, kResponse };
  for (int d=0; d < 2; d++) {
    const FieldSpec *fields = definition.fields(directions[d]);
    size_t count = definition.field_count(directions[d]);
    if (count > 0 && !fields) { return false; }
    for (size_t i=0; i < count; i++) {
      if (fields[i].length == kRemainder) {
        if (i + 1 != count) { return false; }
      } else if (fields[i].length <= 0) {
        return false;
      }
    }
  }
  return true;
}

Breakdown ProtocolDecoder::Decode(const std::string& hex, Direction direction)
{
  return Decode(util::HexToBytes(hex), direction);
}

Breakdown ProtocolDecoder::Decode(const Bytes& data, Direction direction)
{
  Breakdown result;
  result.direction = direction;
  if (data.empty()) { return result; }

  const CommandDefinition& definition = Lookup(data[0]);
  result.definition = &definition;

  const FieldSpec *fields = definition.fields(direction);
  size_t count = definition.field_count(direction);
  if (count == 0) { return result; }

  size_t cursor = 0;
  for (size_t i=0; i < count && cursor < data.size(); i++) {
    size_t left = data.size() - cursor;
    size_t length = fields[i].length == kRemainder ? left : std::min(left, (size_t)fields[i].length);
    BreakdownField field = { fields[i].name, length, Slice(data, cursor, length), false };
    result.fields.push_back(field);
    cursor += length;
  }

  if (cursor < data.size()) {
    size_t length = data.size() - cursor;
    BreakdownField field = { "Unparsed Data", length, Slice(data, cursor, length), true };
    result.fields.push_back(field);
  }
  return result;
}

std::string ProtocolDecoder::Format(const Breakdown& breakdown)
{
  if (!breakdown.definition) { return "No data to parse."; }

  std::ostringstream out;
  out << format("%s (%s)") % breakdown.definition->name % DirectionName(breakdown.direction);
  if (breakdown.definition->field_count(breakdown.direction) == 0) {
    out << format("\n - No %s fields defined.") % (breakdown.direction == kCommand ? "command" : "response");
    return out.str();
  }
  for (size_t i=0; i < breakdown.fields.size(); i++) {
    const BreakdownField& f = breakdown.fields[i];
    if (f.unparsed) {
      out << format("\n - %s: 0x%s") % f.name % f.hex;
    } else {
      out << format("\n - %s (%uB): 0x%s") % f.name % f.length % f.hex;
    }
  }
  return out.str();
}

}
