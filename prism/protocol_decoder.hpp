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
/// @brief Field by field breakdown of SPI commands and responses
#ifndef PROTOCOL_DECODER_HPP__
#define PROTOCOL_DECODER_HPP__

#include "util.hpp"
#include <stddef.h>
#include <string>
#include <vector>

namespace prism {

enum Direction { kCommand, kResponse };

/// Field length meaning "all bytes left"; only valid for the last field of a list
const int kRemainder = -1;

struct FieldSpec
{
  const char *name;
  int length;          ///< Bytes, or kRemainder
};

/// Layout of one opcode in both directions.
/// An empty field list (count 0) means no payload is expected in that direction.
struct CommandDefinition
{
  int opcode;          ///< First command byte; -1 for the default definition
  const char *name;
  const FieldSpec *command_fields;
  size_t command_field_count;
  const FieldSpec *response_fields;
  size_t response_field_count;

  const FieldSpec *fields(Direction d) const { return d == kCommand ? command_fields : response_fields; }
  size_t field_count(Direction d) const { return d == kCommand ? command_field_count : response_field_count; }
};

struct BreakdownField
{
  std::string name;
  size_t length;
  std::string hex;     ///< Upper case, no prefix
  bool unparsed;       ///< Trailing bytes not covered by the definition
};

struct Breakdown
{
  const CommandDefinition *definition;   ///< NULL for empty input
  Direction direction;
  std::vector<BreakdownField> fields;

  Breakdown() : definition(NULL), direction(kCommand) {}

  /// Bytes covered by named (not unparsed) fields
  size_t consumed() const;
  bool has_unparsed() const { return !fields.empty() && fields.back().unparsed; }
};

/// Maps a buffer to named fields using a static opcode table.
/// The first byte of the buffer selects the definition, in either direction.
/// Decoding is pure; unknown opcodes use the default definition.
class ProtocolDecoder
{
public:
  /// @throw InvalidHexError on odd length or non hex characters
  static Breakdown Decode(const std::string& hex, Direction direction);

  static Breakdown Decode(const Bytes& data, Direction direction);

  /// Definition for opcode, or the default definition
  static const CommandDefinition& Lookup(uint8_t opcode);
  static const CommandDefinition& DefaultDefinition();

  /// Built-in definitions, excluding the default
  static const CommandDefinition *Definitions(size_t& count);

  /// Positive lengths, with at most one kRemainder and only as the last field
  static bool IsValidDefinition(const CommandDefinition& definition);

  /// Multi line text rendering, as shown in a breakdown pane
  static std::string Format(const Breakdown& breakdown);
};

}

#endif // PROTOCOL_DECODER_HPP__
