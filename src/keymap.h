// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "inputevent.h"

#include <map>

// -------------------------------------------------------------------------------------------------
/// Immutable key substitution table. Total over all keys: modifiers map to Key::None,
/// every other key maps to its configured substitution or to itself.
class KeyMap
{
public:
  using Table = std::map<Key, Key>;

  KeyMap() = default;
  explicit KeyMap(Table substitutions);

  /// Mapping target for `key`, or Key::None for modifier keys.
  Key map(Key key) const;

  const Table& substitutions() const { return m_table; }
  bool empty() const { return m_table.empty(); }

private:
  Table m_table;
};
