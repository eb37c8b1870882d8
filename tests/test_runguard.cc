// This file is part of sc2remap - See LICENSE.md and README.md
#include "runguard.h"

#include "testutil.h"

#include <QDir>
#include <QTemporaryDir>

// -------------------------------------------------------------------------------------------------
TEST_CASE("only one guard holds the lock", "[runguard]")
{
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  const QString path = QDir(dir.path()).filePath("sc2remap.pid");

  RunGuard first(path);
  REQUIRE(first.tryToRun());

  RunGuard second(path);
  CHECK_FALSE(second.tryToRun());
  CHECK(second.lockedByOther());
  CHECK(second.isAnotherRunning());

  first.release();
  CHECK(second.tryToRun());
}

// -------------------------------------------------------------------------------------------------
TEST_CASE("a lock file that cannot be created is not another instance", "[runguard]")
{
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  const QString path = QDir(dir.path()).filePath("missing-directory/sc2remap.pid");

  RunGuard guard(path);
  CHECK_FALSE(guard.tryToRun());
  CHECK_FALSE(guard.lockedByOther());
  CHECK_FALSE(guard.errorString().isEmpty());
}
