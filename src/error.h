// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include <QMetaType>
#include <QString>

#include <cstdint>
#include <utility>

// -------------------------------------------------------------------------------------------------
/// Error with its handling class.
///  - Skippable: log and continue (e.g. a candidate device that cannot be opened)
///  - Transient: flow control only, wait and try again (e.g. EAGAIN on non-blocking read)
///  - Fatal: terminate the daemon, no retry
struct Error
{
  enum class Severity : uint8_t { Skippable, Transient, Fatal };

  Error() = default;
  Error(Severity severity, QString message, int sysError = 0)
    : severity(severity), message(std::move(message)), sysError(sysError) {}

  static Error skippable(const QString& message, int sysError = 0) {
    return Error(Severity::Skippable, message, sysError);
  }
  static Error fatal(const QString& message, int sysError = 0) {
    return Error(Severity::Fatal, message, sysError);
  }

  bool isFatal() const { return severity == Severity::Fatal; }

  /// Message including the system error description if set.
  QString toString() const;

  Severity severity = Severity::Fatal;
  QString message;
  int sysError = 0; ///< errno value, 0 if not a system error
};
Q_DECLARE_METATYPE(Error)

const char* toString(Error::Severity s, bool withClass = true);
