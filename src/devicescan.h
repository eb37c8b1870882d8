// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include <QStringList>

#include <cstdint>
#include <vector>

// -------------------------------------------------------------------------------------------------
namespace DeviceScan
{
  struct EventDevice { // Structure for device scan results
    QString deviceFile;  ///< e.g. /dev/input/event3
    int eventId = -1;    ///< the number N of /dev/input/eventN
    QString name;
    QString phys;
    uint16_t vendorId = 0;
    uint16_t productId = 0;
    uint16_t busType = 0;
    bool hasKeys = false;
    bool hasRelativeEvents = false;
    bool deviceReadable = false;
  };

  struct ScanResult {
    std::vector<EventDevice> devices; ///< sorted by event id
    quint16 numDevicesReadable = 0;
    QStringList errorMessages;
  };

  /// Scan all input event device nodes; device information is read from sysfs if available.
  ScanResult getDevices(const QString& inputDevicePath = "/dev/input",
                        const QString& sysClassPath = "/sys/class/input");

  /// Path of the event device node with the given id.
  QString eventDevicePath(int eventId, const QString& inputDevicePath = "/dev/input");
}
