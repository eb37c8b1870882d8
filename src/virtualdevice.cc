// This file is part of sc2remap - See LICENSE.md and README.md

#include "virtualdevice.h"

#include "logging.h"

#include <fcntl.h>
#include <linux/uinput.h>
#include <linux/input-event-codes.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <QFileInfo>

#include <cerrno>
#include <cstdio>
#include <vector>

LOGGING_CATEGORY(virtualdevice, "virtualdevice")

namespace  {
  class VirtualDevice_ : public QObject {}; // for i18n and logging
} // end anonymous namespace

struct VirtualDevice::Token {};

// -------------------------------------------------------------------------------------------------
VirtualDevice::VirtualDevice(Token /* token */, int fd, const QString& name, const char* sysfs_name)
  : m_uinpFd(fd)
  , m_userName(name)
  , m_deviceName(sysfs_name)
{}

// -------------------------------------------------------------------------------------------------
VirtualDevice::~VirtualDevice()
{
  if (m_uinpFd >= 0)
  {
    ioctl(m_uinpFd, UI_DEV_DESTROY);
    ::close(m_uinpFd);
    logDebug(virtualdevice)
      << VirtualDevice_::tr("uinput Device Closed (%1; %2)").arg(m_userName, m_deviceName);
  }
}

// -------------------------------------------------------------------------------------------------
// Setup a uinput device that can send every key, button and relative event.
std::shared_ptr<VirtualDevice> VirtualDevice::create(const Options& options, Error& error)
{
  const QFileInfo fi(options.location);
  if (!fi.exists()) {
    error = Error::fatal(VirtualDevice_::tr("File not found: %1 - please check if uinput kernel "
                                            "module is loaded").arg(options.location));
    return std::shared_ptr<VirtualDevice>();
  }

  const int fd = ::open(options.location.toLocal8Bit().constData(), O_WRONLY | O_NDELAY);
  if (fd < 0) {
    error = Error::fatal(VirtualDevice_::tr("Unable to open: %1 - please check if current user "
                                            "has write access").arg(options.location), errno);
    return std::shared_ptr<VirtualDevice>();
  }

  struct uinput_user_dev uinp {};
  snprintf(uinp.name, sizeof(uinp.name), "%s", options.name.toLocal8Bit().constData());
  uinp.id.bustype = options.busType;
  uinp.id.vendor = options.vendorId;
  uinp.id.product = options.productId;
  uinp.id.version = options.versionId;

  // Setup the uinput device
  // (see all in Linux's input-event-codes.h)
  ioctl(fd, UI_SET_EVBIT, EV_SYN);
  ioctl(fd, UI_SET_EVBIT, EV_KEY);
  ioctl(fd, UI_SET_EVBIT, EV_REL);
  ioctl(fd, UI_SET_EVBIT, EV_MSC);
  ioctl(fd, UI_SET_MSCBIT, MSC_SCAN);

  // Set all relative event code bits on virtual device
  for (int i = 0; i < REL_CNT; ++i) {
    ioctl(fd, UI_SET_RELBIT, i);
  }

  // Keyboard keys and mouse buttons
  for (int i = 1; i <= KEY_MAX; ++i) {
    ioctl(fd, UI_SET_KEYBIT, i);
  }

  // Create input device into input sub-system
  const auto bytesWritten = write(fd, &uinp, sizeof(uinp));
  if ((bytesWritten != sizeof(uinp)) || (ioctl(fd, UI_DEV_CREATE)))
  {
    const int err = errno;
    ::close(fd);
    error = Error::fatal(VirtualDevice_::tr("Unable to create Virtual (UINPUT) device."), err);
    return std::shared_ptr<VirtualDevice>();
  }

  // Log the device name
  char sysfs_device_name[16]{};
  ioctl(fd, UI_GET_SYSNAME(sizeof(sysfs_device_name)), sysfs_device_name);
  logInfo(virtualdevice) << VirtualDevice_::tr("Created uinput device: %1")
                            .arg(QString("%1; /sys/devices/virtual/input/%2")
                              .arg(options.name, sysfs_device_name));

  return std::make_shared<VirtualDevice>(Token{}, fd, options.name, sysfs_device_name);
}

// -------------------------------------------------------------------------------------------------
bool VirtualDevice::emitEvents(const InputEvent events[], size_t num)
{
  if (!num) { return true; }

  // timestamps are ignored by uinput
  std::vector<struct input_event> input_events;
  input_events.reserve(num);
  for (size_t i = 0; i < num; ++i) {
    struct input_event ie = events[i].toInputEvent();
    ie.input_event_sec = 0;
    ie.input_event_usec = 0;
    input_events.push_back(ie);
  }

  const ssize_t sz = sizeof(struct input_event) * num;
  const auto bytesWritten = write(m_uinpFd, input_events.data(), sz);
  if (bytesWritten != sz) {
    logError(virtualdevice) << VirtualDevice_::tr("Error while writing to virtual device.");
    return false;
  }
  return true;
}
