// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "error.h"
#include "inputevent.h"

#include <QObject>

#include <functional>
#include <memory>

class EventSource;

// -------------------------------------------------------------------------------------------------
/// Delivers the events of the keyboard and the mouse source to their handlers from the one
/// event loop. A source's events are never reordered; between sources whichever becomes
/// ready first is processed first.
class EventMultiplexer : public QObject
{
  Q_OBJECT

public:
  /// Return false to stop delivering the current batch, e.g. after a fatal error.
  using Handler = std::function<bool(const InputEvent&)>;

  EventMultiplexer(std::shared_ptr<EventSource> keyboard, std::shared_ptr<EventSource> mouse,
                   QObject* parent = nullptr);
  ~EventMultiplexer() override;

  void setKeyboardHandler(Handler handler) { m_keyboardHandler = std::move(handler); }
  void setMouseHandler(Handler handler) { m_mouseHandler = std::move(handler); }

  /// Start watching both sources.
  void start();
  void stop();

  const std::shared_ptr<EventSource>& keyboard() const { return m_keyboard; }
  const std::shared_ptr<EventSource>& mouse() const { return m_mouse; }

signals:
  /// A source could not be read, no more events are delivered from it.
  void sourceFailed(const Error& error);

private:
  std::shared_ptr<EventSource> m_keyboard;
  std::shared_ptr<EventSource> m_mouse;
  Handler m_keyboardHandler;
  Handler m_mouseHandler;
};
