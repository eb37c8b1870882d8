// This file is part of sc2remap - See LICENSE.md and README.md
#include "keymap.h"

// -------------------------------------------------------------------------------------------------
KeyMap::KeyMap(Table substitutions)
  : m_table(std::move(substitutions))
{
  // Modifiers are never remapped and never substitution targets.
  for (auto it = m_table.begin(); it != m_table.end(); ) {
    if (isModifier(it->first) || isModifier(it->second) || it->second == Key::None) {
      it = m_table.erase(it);
    } else {
      ++it;
    }
  }
}

// -------------------------------------------------------------------------------------------------
Key KeyMap::map(Key key) const
{
  if (key == Key::None || isModifier(key)) { return Key::None; }

  const auto it = m_table.find(key);
  return (it != m_table.cend()) ? it->second : key;
}
