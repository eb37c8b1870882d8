// This file is part of sc2remap - See LICENSE.md and README.md
#include "multiplexer.h"

#include "eventsource.h"
#include "logging.h"

LOGGING_CATEGORY(mux, "multiplexer")
TRACE_LOGGING_CATEGORY(muxTrace, "multiplexer")

namespace {
  // -----------------------------------------------------------------------------------------------
  // Motion, sync and misc events are very frequent, they only show up at trace level.
  bool isHighFrequency(const InputEvent& ie)
  {
    switch (ie.code.eventClass()) {
      case EventClass::Sync:
      case EventClass::Misc:
        return true;
      case EventClass::Relative:
        return ie.isRelative(RelAxis::X) || ie.isRelative(RelAxis::Y);
      case EventClass::Key:
      case EventClass::Other:
        return false;
    }
    return false;
  }

  // -----------------------------------------------------------------------------------------------
  void logEvent(const char* role, const InputEvent& ie)
  {
    if (isHighFrequency(ie)) {
      logDebug(muxTrace) << role << "event:" << ie;
    } else {
      logDebug(mux) << role << "event:" << ie;
    }
  }
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
EventMultiplexer::EventMultiplexer(std::shared_ptr<EventSource> keyboard,
                                   std::shared_ptr<EventSource> mouse, QObject* parent)
  : QObject(parent)
  , m_keyboard(std::move(keyboard))
  , m_mouse(std::move(mouse))
{
  connect(m_keyboard.get(), &EventSource::readError, this, &EventMultiplexer::sourceFailed);
  connect(m_mouse.get(), &EventSource::readError, this, &EventMultiplexer::sourceFailed);
}

// -------------------------------------------------------------------------------------------------
EventMultiplexer::~EventMultiplexer()
{
  stop();
  for (const auto& source : {m_keyboard, m_mouse}) {
    if (source) { source->setEventHandler(nullptr); }
  }
}

// -------------------------------------------------------------------------------------------------
void EventMultiplexer::start()
{
  m_keyboard->setEventHandler([this](const InputEvent& ie) {
    logEvent("keyboard", ie);
    return m_keyboardHandler ? m_keyboardHandler(ie) : true;
  });

  m_mouse->setEventHandler([this](const InputEvent& ie) {
    logEvent("mouse", ie);
    return m_mouseHandler ? m_mouseHandler(ie) : true;
  });

  logDebug(mux) << tr("Watching keyboard '%1' and mouse '%2'")
                   .arg(m_keyboard->path(), m_mouse->path());

  m_keyboard->setNotificationsEnabled(true);
  m_mouse->setNotificationsEnabled(true);
}

// -------------------------------------------------------------------------------------------------
// Handlers are kept, stop() may be called from within a handler.
void EventMultiplexer::stop()
{
  for (const auto& source : {m_keyboard, m_mouse}) {
    if (source) { source->setNotificationsEnabled(false); }
  }
}
