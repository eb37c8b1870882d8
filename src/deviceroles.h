// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "error.h"
#include "inputevent.h"

#include <QObject>
#include <QStringList>

#include <memory>
#include <vector>

class EventSource;

// -------------------------------------------------------------------------------------------------
enum class DeviceRole : uint8_t { Keyboard, Mouse };

const char* toString(DeviceRole role, bool withClass = true);

// -------------------------------------------------------------------------------------------------
/// Role of a not yet classified source after seeing `ie`. Returns false if the event
/// does not decide a role that is still open.
bool classifyEvent(const InputEvent& ie, bool keyboardChosen, bool mouseChosen, DeviceRole& role);

// -------------------------------------------------------------------------------------------------
/// Decides which event source is the keyboard and which is the mouse. Exactly one of the
/// signals resolved() or failed() is emitted after start(), never from within start().
class RoleResolver : public QObject
{
  Q_OBJECT

public:
  using QObject::QObject;
  ~RoleResolver() override = default;

  virtual void start() = 0;

signals:
  void resolved(const std::shared_ptr<EventSource>& keyboard,
                const std::shared_ptr<EventSource>& mouse);
  void failed(const Error& error);
};

// -------------------------------------------------------------------------------------------------
/// Watches all candidate sources and classifies them by the first events they produce.
/// Sources that do not get a role are closed.
class SignatureRoleResolver : public RoleResolver
{
  Q_OBJECT

public:
  explicit SignatureRoleResolver(std::vector<std::shared_ptr<EventSource>> candidates,
                                 QObject* parent = nullptr);
  ~SignatureRoleResolver() override;

  /// Open all given device paths, paths that cannot be opened are skipped.
  static std::vector<std::shared_ptr<EventSource>> openCandidates(const QStringList& devicePaths);

  void start() override;

private:
  bool onEvent(EventSource* source, const InputEvent& ie);
  void finish();
  void fail(const Error& error);

  std::vector<std::shared_ptr<EventSource>> m_candidates;
  std::shared_ptr<EventSource> m_keyboard;
  std::shared_ptr<EventSource> m_mouse;
  bool m_done = false;
};

// -------------------------------------------------------------------------------------------------
/// Uses explicitly given event device nodes, nothing is classified.
class ExplicitRoleResolver : public RoleResolver
{
  Q_OBJECT

public:
  ExplicitRoleResolver(const QString& keyboardPath, const QString& mousePath,
                       QObject* parent = nullptr);

  void start() override;

private:
  const QString m_keyboardPath;
  const QString m_mousePath;
};
