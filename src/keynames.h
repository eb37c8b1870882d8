// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "inputevent.h"

#include <QString>

namespace KeyName
{
  /// Resolve a key name ('a', 'f5', 'capslock', 'btn_side') or a numeric code ('30', '0x1e').
  /// Returns Key::None if the name is unknown.
  Key fromString(const QString& name);

  /// Name of the key, or its numeric code if no name is known.
  QString toString(Key key);
} // end namespace KeyName
