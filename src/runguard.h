// This file is part of sc2remap - See LICENSE.md and README.md
#pragma once

#include <QLockFile>
#include <QString>

/// Single instance guard, an advisory lock on a well known file.
class RunGuard
{
public:
  explicit RunGuard(const QString& lockFilePath);
  ~RunGuard();

  /// Default lock file: $XDG_RUNTIME_DIR/<name>.pid or /var/run/user/<euid>/<name>.pid
  static QString defaultLockFilePath(const QString& name);

  bool isAnotherRunning();
  bool tryToRun();
  void release();

  /// After a failed tryToRun(): true if a running process holds the lock, false if the
  /// lock file could not be created at all.
  bool lockedByOther() const;
  QString errorString() const;

  const QString& lockFilePath() const { return m_lockFilePath; }

private:
  const QString m_lockFilePath;
  QLockFile m_lockFile;

  Q_DISABLE_COPY(RunGuard)
};
