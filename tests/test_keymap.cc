// This file is part of sc2remap - See LICENSE.md and README.md
#include "keymap.h"

#include "testutil.h"

// -------------------------------------------------------------------------------------------------
TEST_CASE("keymap substitutes configured keys and keeps others", "[keymap]")
{
  const KeyMap km({{toKey(KEY_1), toKey(KEY_6)}, {toKey(KEY_2), toKey(KEY_7)}});

  CHECK(km.map(toKey(KEY_1)) == toKey(KEY_6));
  CHECK(km.map(toKey(KEY_2)) == toKey(KEY_7));
  CHECK(km.map(toKey(KEY_A)) == toKey(KEY_A));
  CHECK(km.map(toKey(KEY_6)) == toKey(KEY_6));
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("keymap never maps modifiers", "[keymap]")
{
  const KeyMap km;
  for (const auto code : {KEY_LEFTSHIFT, KEY_RIGHTSHIFT, KEY_LEFTCTRL, KEY_RIGHTCTRL,
                          KEY_LEFTALT, KEY_RIGHTALT, KEY_LEFTMETA, KEY_RIGHTMETA})
  {
    CHECK(km.map(toKey(code)) == Key::None);
  }
  CHECK(km.map(Key::None) == Key::None);
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("keymap drops entries with modifiers", "[keymap]")
{
  const KeyMap km({{toKey(KEY_LEFTCTRL), toKey(KEY_A)},
                   {toKey(KEY_B), toKey(KEY_RIGHTALT)},
                   {toKey(KEY_C), toKey(KEY_D)}});

  CHECK(km.substitutions().size() == 1);
  CHECK(km.map(toKey(KEY_LEFTCTRL)) == Key::None);
  CHECK(km.map(toKey(KEY_B)) == toKey(KEY_B));
  CHECK(km.map(toKey(KEY_C)) == toKey(KEY_D));
}
