// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "error.h"
#include "eventsource.h"
#include "inputevent.h"
#include "keynames.h"
#include "virtualdevice.h"

#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <QElapsedTimer>

#include <functional>
#include <memory>

#include <fcntl.h>
#include <unistd.h>

namespace testutil {

// -------------------------------------------------------------------------------------------------
/// Records all emitted events, can be switched to fail every write.
class RecordingSink : public EventSink
{
public:
  bool emitEvents(const InputEvent events[], size_t num) override
  {
    ++writes;
    if (fail) { return false; }
    recorded.insert(recorded.end(), events, events + num);
    return true;
  }
  using EventSink::emitEvents;

  EventSequence recorded;
  int writes = 0;
  bool fail = false;
};

// -------------------------------------------------------------------------------------------------
/// A pipe standing in for an evdev device node, the read end becomes an EventSource.
class DevicePipe
{
public:
  DevicePipe()
  {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == 0) {
      m_readFd = fds[0];
      m_writeFd = fds[1];
    }
  }

  ~DevicePipe()
  {
    closeWriteEnd();
    if (m_readFd != -1) { ::close(m_readFd); }
  }

  DevicePipe(const DevicePipe&) = delete;
  DevicePipe& operator=(const DevicePipe&) = delete;

  bool isValid() const { return m_writeFd != -1; }

  /// Hands the read end over to a new EventSource.
  std::shared_ptr<EventSource> source(const QString& path)
  {
    Error error;
    const int fd = m_readFd;
    m_readFd = -1;
    return EventSource::fromDescriptor(fd, path, error);
  }

  bool write(const EventSequence& events)
  {
    for (const auto& e : events) {
      const struct input_event ie = e.toInputEvent();
      if (::write(m_writeFd, &ie, sizeof(ie)) != sizeof(ie)) { return false; }
    }
    return true;
  }

  bool write(const InputEvent& event) { return write(EventSequence{event}); }

  void closeWriteEnd()
  {
    if (m_writeFd != -1) { ::close(m_writeFd); }
    m_writeFd = -1;
  }

private:
  int m_readFd = -1;
  int m_writeFd = -1;
};

// -------------------------------------------------------------------------------------------------
/// Process Qt events until `condition` is true or the timeout is reached.
inline bool waitFor(const std::function<bool()>& condition, int timeoutMs = 2000)
{
  QElapsedTimer timer;
  timer.start();
  while (!condition()) {
    if (timer.elapsed() > timeoutMs) { return false; }
    QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
  }
  return true;
}

// -------------------------------------------------------------------------------------------------
inline void processPendingEvents(int ms = 50)
{
  waitFor([](){ return false; }, ms);
}

} // end namespace testutil

// -------------------------------------------------------------------------------------------------
namespace Catch {
  template<>
  struct StringMaker<InputEvent> {
    static std::string convert(const InputEvent& ie)
    {
      QString s;
      QDebug(&s).nospace() << ie;
      return s.toStdString();
    }
  };
}
