// This file is part of sc2remap - See LICENSE.md and README.md
#include "devicescan.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <linux/input.h>

#include <algorithm>

namespace {
  class DeviceScan_ : public QObject {}; // for i18n and logging

  // -----------------------------------------------------------------------------------------------
  quint64 readULongLongFromDeviceFile(const QString& filename)
  {
    QFile f(filename);
    if (f.open(QIODevice::ReadOnly)) {
      // multi word bitmaps are space separated, the last word holds the lowest bits
      const auto words = f.readAll().trimmed().split(' ');
      return words.isEmpty() ? 0 : words.last().toULongLong(nullptr, 16);
    }
    return 0;
  }

  // -----------------------------------------------------------------------------------------------
  QString readStringFromDeviceFile(const QString& filename)
  {
    QFile f(filename);
    if (f.open(QIODevice::ReadOnly)) {
      return f.readAll().trimmed();
    }
    return QString();
  }

  // -----------------------------------------------------------------------------------------------
  uint16_t readIdFromDeviceFile(const QString& filename)
  {
    return readStringFromDeviceFile(filename).toUShort(nullptr, 16);
  }

  // -----------------------------------------------------------------------------------------------
  // Fill name, ids and capabilities from /sys/class/input/eventN/device
  void readSysfsInfo(DeviceScan::EventDevice& device, const QString& sysClassPath)
  {
    const QDir sysDevice(QDir(sysClassPath).filePath(QString("event%1/device").arg(device.eventId)));
    if (!sysDevice.exists()) { return; }

    device.name = readStringFromDeviceFile(sysDevice.filePath("name"));
    device.phys = readStringFromDeviceFile(sysDevice.filePath("phys"));
    device.vendorId = readIdFromDeviceFile(sysDevice.filePath("id/vendor"));
    device.productId = readIdFromDeviceFile(sysDevice.filePath("id/product"));
    device.busType = readIdFromDeviceFile(sysDevice.filePath("id/bustype"));

    const auto supportedEvents = readULongLongFromDeviceFile(sysDevice.filePath("capabilities/ev"));
    device.hasKeys = !!(supportedEvents & (1 << EV_KEY));
    device.hasRelativeEvents = !!(supportedEvents & (1 << EV_REL));
  }
} // end anonymous namespace

namespace DeviceScan {
  // -----------------------------------------------------------------------------------------------
  QString eventDevicePath(int eventId, const QString& inputDevicePath)
  {
    return QDir(inputDevicePath).filePath(QString("event%1").arg(eventId));
  }

  // -----------------------------------------------------------------------------------------------
  ScanResult getDevices(const QString& inputDevicePath, const QString& sysClassPath)
  {
    ScanResult result;
    const QFileInfo dpInfo(inputDevicePath);

    if (!dpInfo.exists()) {
      result.errorMessages.push_back(DeviceScan_::tr("Input device path '%1' does not exist.").arg(inputDevicePath));
      return result;
    }

    if (!dpInfo.isExecutable()) {
      result.errorMessages.push_back(DeviceScan_::tr("Input device path '%1': Cannot list files.").arg(inputDevicePath));
      return result;
    }

    QDirIterator devIt(inputDevicePath, {"event*"}, QDir::System | QDir::Files | QDir::NoDotAndDotDot);
    while (devIt.hasNext())
    {
      devIt.next();

      bool ok = false;
      const int eventId = devIt.fileName().mid(5).toInt(&ok);
      if (!ok) continue;

      EventDevice device;
      device.deviceFile = devIt.filePath();
      device.eventId = eventId;
      readSysfsInfo(device, sysClassPath);

      device.deviceReadable = devIt.fileInfo().isReadable();
      result.numDevicesReadable += device.deviceReadable;
      result.devices.emplace_back(std::move(device));
    }

    std::sort(result.devices.begin(), result.devices.end(),
    [](const EventDevice& a, const EventDevice& b) { return a.eventId < b.eventId; });

    return result;
  }
}
