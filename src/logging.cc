// This file is part of sc2remap - See LICENSE.md and README.md
#include "logging.h"

#include <QDateTime>
#include <QString>

#include <iostream>

namespace {
  // -----------------------------------------------------------------------------------------------
  void sc2remapLogHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgQString);
  void categoryFilterInfo(QLoggingCategory *category);

  // Install our custom message handler, store previous message handler
  const QtMessageHandler defaultMessageHandler = qInstallMessageHandler(sc2remapLogHandler);
  const QLoggingCategory::CategoryFilter defaultCategoryFilter = QLoggingCategory::installFilter(categoryFilterInfo);
  QLoggingCategory::CategoryFilter currentCategoryFilter = categoryFilterInfo;

  constexpr char categoryPrefix[] = "sc2remap.";
  constexpr char traceCategoryPrefix[] = "sc2remap.trace.";

  inline bool isAppCategory(QLoggingCategory* category) {
    return (qstrncmp(categoryPrefix, category->categoryName(), sizeof(categoryPrefix)-1) == 0);
  }

  inline bool isTraceCategory(QLoggingCategory* category) {
    return (qstrncmp(traceCategoryPrefix, category->categoryName(), sizeof(traceCategoryPrefix)-1) == 0);
  }

  void setAppCategoryLevels(QLoggingCategory *category, bool dbg, bool inf, bool wrn)
  {
    // Trace categories only ever log on debug level
    const bool trace = isTraceCategory(category);
    category->setEnabled(QtDebugMsg, dbg);
    category->setEnabled(QtInfoMsg, inf && !trace);
    category->setEnabled(QtWarningMsg, wrn && !trace);
    category->setEnabled(QtCriticalMsg, !trace);
  }

  void categoryFilterTrace(QLoggingCategory *category)
  {
    if (isAppCategory(category)) {
      setAppCategoryLevels(category, true, true, true);
    } else {
      defaultCategoryFilter(category);
    }
  }

  void categoryFilterDebug(QLoggingCategory *category)
  {
    if (isAppCategory(category)) {
      setAppCategoryLevels(category, !isTraceCategory(category), true, true);
    } else {
      defaultCategoryFilter(category);
    }
  }

  void categoryFilterInfo(QLoggingCategory *category)
  {
    if (isAppCategory(category)) {
      setAppCategoryLevels(category, false, true, true);
    } else {
      defaultCategoryFilter(category);
    }
  }

  void categoryFilterWarning(QLoggingCategory *category)
  {
    if (isAppCategory(category)) {
      setAppCategoryLevels(category, false, false, true);
    } else {
      defaultCategoryFilter(category);
    }
  }

  void categoryFilterError(QLoggingCategory *category)
  {
    if (isAppCategory(category)) {
      setAppCategoryLevels(category, false, false, false);
    } else {
      defaultCategoryFilter(category);
    }
  }

  // -----------------------------------------------------------------------------------------------
  inline const char* typeToShortString(QtMsgType type) {
    switch (type) {
      case QtDebugMsg: return "dbg";
      case QtInfoMsg: return "inf";
      case QtWarningMsg: return "wrn";
      case QtCriticalMsg: return "err";
      case QtFatalMsg: return "fat";
    }
    return "";
  }

  // -----------------------------------------------------------------------------------------------
  // All logging is done from within the single event loop thread - NOT thread safe
  void sc2remapLogHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgQString)
  {
    const char *category = context.category ? context.category : "";

    #if (QT_VERSION >= QT_VERSION_CHECK(5, 8, 0))
      constexpr auto dateFormat = Qt::ISODateWithMs;
    #else
      constexpr auto dateFormat = Qt::ISODate;
    #endif

    const auto logMsg = QString("[%1][%2][%3] %4").arg(QDateTime::currentDateTimeUtc().toString(dateFormat),
                                                       typeToShortString(type), category, msgQString);

    if (type == QtDebugMsg || type == QtInfoMsg)
      std::cout << qUtf8Printable(logMsg) << std::endl;
    else
      std::cerr << qUtf8Printable(logMsg) << std::endl;
  }
} // end anonymous namespace

namespace logging {
  const char* levelToString(level lvl)
  {
    switch (lvl) {
      case level::trace: return "trace";
      case level::debug: return "debug";
      case level::info: return "info";
      case level::warning: return "warning";
      case level::error: return "error";
      case level::custom: return "default/custom";
      case level::unknown: return "unknown";
    }
    return "";
  }

  level levelFromName(const QString& name)
  {
    const auto lvlName = name.toLower();
    if (lvlName == "trc" || lvlName == "trace") return level::trace;
    if (lvlName == "dbg" || lvlName == "debug") return level::debug;
    if (lvlName == "inf" || lvlName == "info") return level::info;
    if (lvlName == "wrn" || lvlName == "warning") return level::warning;
    if (lvlName == "err" || lvlName == "error") return level::error;
    return level::unknown;
  }

  level currentLevel()
  {
    if (currentCategoryFilter == defaultCategoryFilter) return level::custom;
    if (currentCategoryFilter == categoryFilterTrace) return level::trace;
    if (currentCategoryFilter == categoryFilterDebug) return level::debug;
    if (currentCategoryFilter == categoryFilterInfo) return level::info;
    if (currentCategoryFilter == categoryFilterWarning) return level::warning;
    if (currentCategoryFilter == categoryFilterError) return level::error;
    return level::unknown;
  }

  void setCurrentLevel(level lvl)
  {
    QLoggingCategory::CategoryFilter newFilter = currentCategoryFilter;

    if (lvl == level::trace)
      newFilter = categoryFilterTrace;
    else if (lvl == level::debug)
      newFilter = categoryFilterDebug;
    else if (lvl == level::info)
      newFilter = categoryFilterInfo;
    else if (lvl == level::warning)
      newFilter = categoryFilterWarning;
    else if (lvl == level::error)
      newFilter = categoryFilterError;
    else if (lvl == level::custom)
      newFilter = defaultCategoryFilter;

    if (newFilter != currentCategoryFilter) {
      QLoggingCategory::installFilter(newFilter);
      currentCategoryFilter = newFilter;
    }
  }

  QString hexId(unsigned short id) {
    return QString("%1").arg(id, 4, 16, QChar('0'));
  }
}
