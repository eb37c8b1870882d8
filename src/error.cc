// This file is part of sc2remap - See LICENSE.md and README.md
#include "error.h"

#include "enum-helper.h"

#include <cstring>

namespace {
  const int registered_ = qRegisterMetaType<Error>();
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
QString Error::toString() const
{
  if (sysError == 0) { return message; }
  return QString("%1 (%2)").arg(message, QString::fromLocal8Bit(std::strerror(sysError)));
}

// -------------------------------------------------------------------------------------------------
const char* toString(Error::Severity s, bool withClass)
{
  using Severity = Error::Severity;
  switch (s) {
    ENUM_CASE_STRINGIFY3(Severity, Skippable, withClass);
    ENUM_CASE_STRINGIFY3(Severity, Transient, withClass);
    ENUM_CASE_STRINGIFY3(Severity, Fatal, withClass);
  }
  return withClass ? "Severity::(unknown)" : "(unknown)";
}
