// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include "error.h"
#include "inputevent.h"

#include <QObject>
#include <QString>

#include <array>
#include <functional>
#include <memory>
#include <vector>

class QSocketNotifier;

// -------------------------------------------------------------------------------------------------
template<int Size, typename T = struct input_event>
struct InputBuffer {
  auto data() { return data_.data(); }
  constexpr size_t size() const { return Size; }
  constexpr size_t sizeBytes() const { return Size * sizeof(T); }
  T& operator[](size_t pos) { return data_[pos]; }
private:
  std::array<T, Size> data_;
};

// -------------------------------------------------------------------------------------------------
/// One evdev input device node, opened read-only and non-blocking.
///
/// Every readiness notification drains the device completely: events are decoded and
/// delivered until the read returns EAGAIN. Only then the source waits for the next
/// notification.
class EventSource : public QObject
{
  Q_OBJECT
  class Token{};

public:
  /// Called for every event in device order. Returning false stops the current drain: the
  /// rest of the batch already read from the device is dropped, data still pending on the
  /// device is read on the next notification.
  using EventHandler = std::function<bool(const InputEvent&)>;

  /// Open a device node; on failure an empty shared_ptr is returned and error is set.
  static std::shared_ptr<EventSource> open(const QString& devicePath, Error& error);

  /// Create a source from an already opened descriptor, ownership is taken over.
  static std::shared_ptr<EventSource> fromDescriptor(int fd, const QString& path, Error& error);

  EventSource(Token, int fd, const QString& path);
  ~EventSource() override;

  const QString& path() const { return m_path; }
  const QString& name() const { return m_name; }
  uint16_t vendorId() const { return m_vendorId; }
  uint16_t productId() const { return m_productId; }

  bool isConnected() const;

  /// Exclusive access to the device events (EVIOCGRAB).
  bool grab(Error& error);

  /// Keys that the kernel reports as currently down on this device (EVIOCGKEY).
  bool pressedKeys(std::vector<Key>& keys, Error& error) const;

  /// Decode a kernel key state bitmap, one bit per key code.
  static std::vector<Key> keysFromBitmap(const uint8_t* bits, size_t sizeBytes);

  /// Read and drop all events that are currently pending on the device.
  bool discardPending(Error& error);

  void setEventHandler(EventHandler handler);

  /// Enable/disable the read notifier (initially disabled); a disabled source keeps its
  /// unread events.
  void setNotificationsEnabled(bool enabled);

  /// Destroys the read notifier, releases the grab and closes the file handle.
  void disconnect();

signals:
  /// Any read failure other than EAGAIN, the source is disconnected afterwards.
  void readError(const Error& error);

private:
  void onDataAvailable();
  void queryDeviceInfo();
  bool readPending(Error& error, const EventHandler& handler);

  int m_fd = -1;
  QString m_path;
  QString m_name;
  uint16_t m_vendorId = 0;
  uint16_t m_productId = 0;
  bool m_grabbed = false;
  EventHandler m_handler;
  std::unique_ptr<QSocketNotifier> m_readNotifier;
  InputBuffer<64> m_inputEventBuffer;
};
