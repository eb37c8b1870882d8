// This file is part of sc2remap - See LICENSE.md and README.md
#include "runguard.h"

#include <QCoreApplication>
#include <QDir>

#include <cerrno>
#include <csignal>
#include <unistd.h>

// -------------------------------------------------------------------------------------------------
RunGuard::RunGuard(const QString& lockFilePath)
  : m_lockFilePath(lockFilePath)
  , m_lockFile(lockFilePath)
{
  m_lockFile.setStaleLockTime(0); // never time out, stale locks are detected by pid
}

// -------------------------------------------------------------------------------------------------
RunGuard::~RunGuard()
{
  release();
}

// -------------------------------------------------------------------------------------------------
QString RunGuard::defaultLockFilePath(const QString& name)
{
  const QString runtimeDir = QString::fromLocal8Bit(qgetenv("XDG_RUNTIME_DIR"));
  const QString dir = (!runtimeDir.isEmpty() && QDir(runtimeDir).exists())
                      ? runtimeDir
                      : QString("/var/run/user/%1").arg(geteuid());
  return QDir(dir).filePath(name + ".pid");
}

// -------------------------------------------------------------------------------------------------
bool RunGuard::isAnotherRunning()
{
  if (m_lockFile.isLocked())
    return false;

  qint64 pid = 0;
  QString hostname, appname;
  if (!m_lockFile.getLockInfo(&pid, &hostname, &appname))
    return false;

  // getLockInfo also reports stale locks of crashed processes
  return pid > 0 && (::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM);
}

// -------------------------------------------------------------------------------------------------
bool RunGuard::tryToRun()
{
  if (m_lockFile.isLocked())
    return true;

  if (m_lockFile.tryLock(0))
    return true;

  // Remove a lock left behind by a crashed instance and try once more.
  if (m_lockFile.error() == QLockFile::LockFailedError && !isAnotherRunning()) {
    m_lockFile.removeStaleLockFile();
    return m_lockFile.tryLock(0);
  }
  return false;
}

// -------------------------------------------------------------------------------------------------
bool RunGuard::lockedByOther() const
{
  return m_lockFile.error() == QLockFile::LockFailedError;
}

// -------------------------------------------------------------------------------------------------
QString RunGuard::errorString() const
{
  switch (m_lockFile.error()) {
    case QLockFile::NoError: return QString();
    case QLockFile::LockFailedError:
      return QCoreApplication::translate("RunGuard", "Lock file '%1' is held by another process.")
             .arg(m_lockFilePath);
    case QLockFile::PermissionError:
      return QCoreApplication::translate("RunGuard", "No permission to create lock file '%1'.")
             .arg(m_lockFilePath);
    case QLockFile::UnknownError: break;
  }
  return QCoreApplication::translate("RunGuard", "Cannot create lock file '%1'.").arg(m_lockFilePath);
}

// -------------------------------------------------------------------------------------------------
void RunGuard::release()
{
  if (m_lockFile.isLocked())
    m_lockFile.unlock();
}
