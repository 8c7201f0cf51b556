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
#include <gtest/gtest.h>

#include "command_catalog.hpp"
#include "protocol_decoder.hpp"
#include "test_helpers.hpp"

using namespace prism;

TEST(CommandCatalogTest, BuiltinOrder)
{
  size_t count = 0;
  const CatalogEntry *entries = CommandCatalog::Builtin(count);
  ASSERT_EQ(count, 3u);
  EXPECT_STREQ(entries[0].label, "Read Status");
  EXPECT_STREQ(entries[0].hex, "0100");
  EXPECT_STREQ(entries[1].label, "Write Enable");
  EXPECT_STREQ(entries[1].hex, "06");
  EXPECT_STREQ(entries[2].label, "Chip Erase");
  EXPECT_STREQ(entries[2].hex, "C7");
}

TEST(CommandCatalogTest, FindByLabel)
{
  const CatalogEntry *entry = CommandCatalog::Find("Chip Erase");
  ASSERT_TRUE(entry != NULL);
  EXPECT_STREQ(entry->hex, "C7");
  EXPECT_TRUE(CommandCatalog::Find("chip erase") == NULL);
  EXPECT_TRUE(CommandCatalog::Find("Page Program") == NULL);
}

TEST(CommandCatalogTest, EveryEntryHasADefinition)
{
  size_t count = 0;
  const CatalogEntry *entries = CommandCatalog::Builtin(count);
  for (size_t i=0; i < count; i++) {
    Breakdown b = ProtocolDecoder::Decode(entries[i].hex, kCommand);
    ASSERT_TRUE(b.definition != NULL) << entries[i].label;
    EXPECT_NE(b.definition, &ProtocolDecoder::DefaultDefinition()) << entries[i].label;
    EXPECT_FALSE(b.has_unparsed()) << entries[i].label;
  }
}
