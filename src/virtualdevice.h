// This file is part of sc2remap - See LICENSE.md and README.md

// Virtual device that receives all remapped and synthesized events.
// The keyboard source is grabbed exclusively, so everything that should reach the
// system has to be written here.

# pragma once

#include "error.h"
#include "inputevent.h"

#include <QString>

#include <cstdint>
#include <memory>

// -------------------------------------------------------------------------------------------------
/// Destination for output events. Implementations must deliver events in call order.
class EventSink
{
public:
  virtual ~EventSink() = default;

  /// Returns false if not all events could be delivered.
  virtual bool emitEvents(const InputEvent events[], size_t num) = 0;
  bool emitEvents(const EventSequence& events) { return emitEvents(events.data(), events.size()); }
};

// -------------------------------------------------------------------------------------------------
/// uinput device that can emit every key, button and relative event.
class VirtualDevice : public EventSink
{
private:
  struct Token;
  int m_uinpFd = -1;
  QString m_userName;
  QString m_deviceName;

public:
  struct Options {
    QString name = "sc2input";
    uint16_t vendorId = 0x0001;
    uint16_t productId = 0x0001;
    uint16_t versionId = 1;
    uint16_t busType = BUS_USB;
    QString location = "/dev/uinput";
  };

  /// Return a VirtualDevice shared_ptr or an empty shared_ptr and a fatal error if the
  /// creation fails.
  static std::shared_ptr<VirtualDevice> create(const Options& options, Error& error);

  VirtualDevice(Token, int fd, const QString& name, const char* sysfs_name);
  ~VirtualDevice() override;

  bool emitEvents(const InputEvent events[], size_t num) override;
  using EventSink::emitEvents;

  const QString& name() const { return m_userName; }
};
