// This file is part of sc2remap - See LICENSE.md and README.md
#include "deviceroles.h"

#include "enum-helper.h"
#include "eventsource.h"
#include "logging.h"

#include <QTimer>

#include <algorithm>

LOGGING_CATEGORY(roles, "roles")

// -------------------------------------------------------------------------------------------------
const char* toString(DeviceRole role, bool withClass)
{
  switch (role) {
    ENUM_CASE_STRINGIFY3(DeviceRole, Keyboard, withClass);
    ENUM_CASE_STRINGIFY3(DeviceRole, Mouse, withClass);
  }
  return withClass ? "DeviceRole::(unknown)" : "(unknown)";
}

// -------------------------------------------------------------------------------------------------
bool classifyEvent(const InputEvent& ie, bool keyboardChosen, bool mouseChosen, DeviceRole& role)
{
  const bool mouseSignature = ie.code.is(EventClass::Relative)
                              || (ie.isKey() && isMouseButton(ie.code.key()));
  if (mouseSignature && !mouseChosen) {
    role = DeviceRole::Mouse;
    return true;
  }

  // A release, not a press: a source could be in the middle of a key press during startup.
  if (ie.isKey() && ie.isRelease() && !keyboardChosen) {
    role = DeviceRole::Keyboard;
    return true;
  }
  return false;
}

// -------------------------------------------------------------------------------------------------
SignatureRoleResolver::SignatureRoleResolver(std::vector<std::shared_ptr<EventSource>> candidates,
                                             QObject* parent)
  : RoleResolver(parent)
  , m_candidates(std::move(candidates))
{}

// -------------------------------------------------------------------------------------------------
SignatureRoleResolver::~SignatureRoleResolver() = default;

// -------------------------------------------------------------------------------------------------
std::vector<std::shared_ptr<EventSource>> SignatureRoleResolver::openCandidates(const QStringList& devicePaths)
{
  std::vector<std::shared_ptr<EventSource>> candidates;
  for (const auto& path : devicePaths)
  {
    Error error;
    if (auto source = EventSource::open(path, error)) {
      candidates.emplace_back(std::move(source));
    } else {
      logWarning(roles) << error.toString();
    }
  }
  return candidates;
}

// -------------------------------------------------------------------------------------------------
void SignatureRoleResolver::start()
{
  if (m_candidates.empty()) {
    const auto error = Error::fatal(tr("No input device could be opened for role identification."));
    QTimer::singleShot(0, this, [this, error](){ emit failed(error); });
    return;
  }

  logInfo(roles) << tr("Waiting for keyboard and mouse events on %1 devices.").arg(m_candidates.size());

  for (const auto& candidate : m_candidates)
  {
    EventSource* source = candidate.get();
    source->setEventHandler([this, source](const InputEvent& ie) {
      return onEvent(source, ie);
    });
    connect(source, &EventSource::readError, this, &SignatureRoleResolver::fail);
    source->setNotificationsEnabled(true);
  }
}

// -------------------------------------------------------------------------------------------------
bool SignatureRoleResolver::onEvent(EventSource* source, const InputEvent& ie)
{
  if (m_done) { return false; }
  if ((m_keyboard && m_keyboard.get() == source) || (m_mouse && m_mouse.get() == source)) {
    return true; // already classified, ignore until all roles are filled
  }

  DeviceRole role;
  if (!classifyEvent(ie, !!m_keyboard, !!m_mouse, role)) { return true; }

  const auto it = std::find_if(m_candidates.cbegin(), m_candidates.cend(),
  [source](const std::shared_ptr<EventSource>& c) { return c.get() == source; });
  if (it == m_candidates.cend()) { return true; }

  logInfo(roles) << tr("Found %1: %2 '%3'").arg(toString(role, false), source->path(), source->name());
  (role == DeviceRole::Keyboard ? m_keyboard : m_mouse) = *it;

  if (!m_keyboard || !m_mouse) { return true; }

  m_done = true;
  for (const auto& candidate : m_candidates) {
    candidate->setNotificationsEnabled(false);
  }
  // Closing sources from within a source's read handler is not safe, continue later.
  QTimer::singleShot(0, this, &SignatureRoleResolver::finish);
  return false;
}

// -------------------------------------------------------------------------------------------------
void SignatureRoleResolver::finish()
{
  for (const auto& candidate : m_candidates) {
    candidate->setEventHandler(nullptr);
    QObject::disconnect(candidate.get(), nullptr, this, nullptr);
  }
  m_candidates.clear(); // closes all sources without a role

  emit resolved(m_keyboard, m_mouse);
  m_keyboard.reset();
  m_mouse.reset();
}

// -------------------------------------------------------------------------------------------------
void SignatureRoleResolver::fail(const Error& error)
{
  if (m_done) { return; }
  m_done = true;
  for (const auto& candidate : m_candidates) {
    candidate->setNotificationsEnabled(false);
  }
  emit failed(error);
}

// -------------------------------------------------------------------------------------------------
ExplicitRoleResolver::ExplicitRoleResolver(const QString& keyboardPath, const QString& mousePath,
                                           QObject* parent)
  : RoleResolver(parent)
  , m_keyboardPath(keyboardPath)
  , m_mousePath(mousePath)
{}

// -------------------------------------------------------------------------------------------------
void ExplicitRoleResolver::start()
{
  QTimer::singleShot(0, this, [this]()
  {
    Error error;
    auto keyboard = EventSource::open(m_keyboardPath, error);
    auto mouse = keyboard ? EventSource::open(m_mousePath, error) : std::shared_ptr<EventSource>();

    if (!keyboard || !mouse) {
      // No other candidate exists, every open failure is fatal here.
      error.severity = Error::Severity::Fatal;
      emit failed(error);
      return;
    }

    logInfo(roles) << tr("Using keyboard %1 '%2'").arg(keyboard->path(), keyboard->name());
    logInfo(roles) << tr("Using mouse %1 '%2'").arg(mouse->path(), mouse->name());
    emit resolved(keyboard, mouse);
  });
}
