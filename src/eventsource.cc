// This file is part of sc2remap - See LICENSE.md and README.md
#include "eventsource.h"

#include "logging.h"

#include <QSocketNotifier>

#include <cerrno>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

LOGGING_CATEGORY(source, "source")

namespace {
  const auto hexId = logging::hexId;
} // end anonymous namespace

// -------------------------------------------------------------------------------------------------
EventSource::EventSource(Token /* token */, int fd, const QString& path)
  : m_fd(fd)
  , m_path(path)
{}

// -------------------------------------------------------------------------------------------------
EventSource::~EventSource()
{
  disconnect();
}

// -------------------------------------------------------------------------------------------------
std::shared_ptr<EventSource> EventSource::open(const QString& devicePath, Error& error)
{
  const int evfd = ::open(devicePath.toLocal8Bit().constData(), O_RDONLY | O_NONBLOCK | O_CLOEXEC, 0);

  if (evfd == -1) {
    error = Error::skippable(tr("Cannot open event device '%1' for read.").arg(devicePath), errno);
    return std::shared_ptr<EventSource>();
  }

  auto source = fromDescriptor(evfd, devicePath, error);
  if (source) { source->queryDeviceInfo(); }
  return source;
}

// -------------------------------------------------------------------------------------------------
std::shared_ptr<EventSource> EventSource::fromDescriptor(int fd, const QString& path, Error& error)
{
  fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
  if ((fcntl(fd, F_GETFL, 0) & O_NONBLOCK) != O_NONBLOCK) {
    error = Error::skippable(tr("Cannot set '%1' to non-blocking mode.").arg(path), errno);
    ::close(fd);
    return std::shared_ptr<EventSource>();
  }

  auto source = std::make_shared<EventSource>(Token{}, fd, path);

  // Create socket notifier, disabled until someone handles the events
  source->m_readNotifier = std::make_unique<QSocketNotifier>(fd, QSocketNotifier::Read);
  source->m_readNotifier->setEnabled(false);
  connect(source->m_readNotifier.get(), &QSocketNotifier::activated,
          source.get(), &EventSource::onDataAvailable);

  return source;
}

// -------------------------------------------------------------------------------------------------
void EventSource::queryDeviceInfo()
{
  char name[256]{};
  if (ioctl(m_fd, EVIOCGNAME(sizeof(name) - 1), name) >= 0) {
    m_name = QString::fromLocal8Bit(name);
  }

  struct input_id id{};
  if (ioctl(m_fd, EVIOCGID, &id) >= 0) { // get the event device id
    m_vendorId = id.vendor;
    m_productId = id.product;
  }

  logDebug(source) << tr("Opened event device: %1 '%2' (%3:%4)")
                      .arg(m_path, m_name, hexId(m_vendorId), hexId(m_productId));
}

// -------------------------------------------------------------------------------------------------
bool EventSource::isConnected() const
{
  return (m_fd != -1);
}

// -------------------------------------------------------------------------------------------------
bool EventSource::grab(Error& error)
{
  if (m_grabbed) { return true; }
  if (m_fd == -1) {
    error = Error::fatal(tr("Cannot grab '%1', device not connected.").arg(m_path));
    return false;
  }

  const int res = ioctl(m_fd, EVIOCGRAB, 1);
  if (res != 0) {
    error = Error::fatal(tr("Error grabbing device: %1 (return value: %2)").arg(m_path).arg(res), errno);
    ioctl(m_fd, EVIOCGRAB, 0);
    return false;
  }

  logDebug(source) << tr("Grabbed device '%1'").arg(m_path);
  m_grabbed = true;
  return true;
}

// -------------------------------------------------------------------------------------------------
bool EventSource::pressedKeys(std::vector<Key>& keys, Error& error) const
{
  keys.clear();
  if (m_fd == -1) {
    error = Error::fatal(tr("Cannot query key state of '%1', device not connected.").arg(m_path));
    return false;
  }

  std::array<uint8_t, KEY_MAX / 8 + 1> bits{};
  if (ioctl(m_fd, EVIOCGKEY(bits.size()), bits.data()) < 0) {
    error = Error::fatal(tr("Cannot query key state of '%1'.").arg(m_path), errno);
    return false;
  }

  keys = keysFromBitmap(bits.data(), bits.size());
  return true;
}

// -------------------------------------------------------------------------------------------------
std::vector<Key> EventSource::keysFromBitmap(const uint8_t* bits, size_t sizeBytes)
{
  std::vector<Key> keys;
  for (size_t byte = 0; byte < sizeBytes; ++byte)
  {
    if (!bits[byte]) continue;
    for (size_t bit = 0; bit < 8; ++bit)
    {
      const size_t code = byte * 8 + bit;
      if (code > KEY_MAX) { return keys; }
      if (bits[byte] & (1u << bit)) { keys.push_back(toKey(static_cast<uint16_t>(code))); }
    }
  }
  return keys;
}

// -------------------------------------------------------------------------------------------------
bool EventSource::discardPending(Error& error)
{
  int discarded = 0;
  const bool ok = readPending(error, [&discarded](const InputEvent&) { ++discarded; return true; });
  if (discarded) {
    logDebug(source) << tr("Discarded %1 pending events from '%2'").arg(discarded).arg(m_path);
  }
  return ok;
}

// -------------------------------------------------------------------------------------------------
void EventSource::setEventHandler(EventHandler handler)
{
  m_handler = std::move(handler);
}

// -------------------------------------------------------------------------------------------------
void EventSource::setNotificationsEnabled(bool enabled)
{
  if (m_readNotifier) { m_readNotifier->setEnabled(enabled); }
}

// -------------------------------------------------------------------------------------------------
void EventSource::disconnect()
{
  if (m_readNotifier) {
    m_readNotifier->setEnabled(false);
    // Might be called from within the notifier's activated signal.
    m_readNotifier.release()->deleteLater();
  }

  if (m_fd != -1)
  {
    if (m_grabbed) {
      ioctl(m_fd, EVIOCGRAB, 0);
      m_grabbed = false;
    }
    logDebug(source) << tr("Closing file descriptor for '%1'").arg(m_path);
    ::close(m_fd);
    m_fd = -1;
  }
}

// -------------------------------------------------------------------------------------------------
// Read until the device reports EAGAIN. Returns false on a read error or if the handler
// requested to stop.
bool EventSource::readPending(Error& error, const EventHandler& handler)
{
  auto& buf = m_inputEventBuffer;
  while (m_fd != -1)
  {
    const auto res = ::read(m_fd, buf.data(), buf.sizeBytes());
    if (res < 0)
    {
      if (errno == EINTR) { continue; }
      if (errno == EAGAIN || errno == EWOULDBLOCK) { return true; } // drained
      error = Error::fatal(tr("Error reading from '%1'.").arg(m_path), errno);
      return false;
    }

    if (res == 0) {
      error = Error::fatal(tr("Device '%1' closed (end of file).").arg(m_path));
      return false;
    }

    if (res % sizeof(struct input_event) != 0) {
      error = Error::fatal(tr("Short read of %1 bytes from '%2'.").arg(res).arg(m_path));
      return false;
    }

    const size_t count = res / sizeof(struct input_event);
    for (size_t i = 0; i < count; ++i)
    {
      if (!handler || !handler(InputEvent(buf[i]))) {
        // Events after i in this batch are already read from the device, deliver
        // nothing further during this drain.
        if (i + 1 < count) {
          logDebug(source) << tr("Stopped draining '%1', %2 events in batch dropped.")
                              .arg(m_path).arg(count - i - 1);
        }
        return false;
      }
    }
  }
  return true;
}

// -------------------------------------------------------------------------------------------------
void EventSource::onDataAvailable()
{
  Error error;
  error.severity = Error::Severity::Transient;
  if (readPending(error, m_handler) || !error.isFatal()) { return; }

  logError(source) << error.toString();
  disconnect();
  emit readError(error);
}
