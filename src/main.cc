// This file is part of sc2remap - See LICENSE.md and README.md

#include "deviceroles.h"
#include "devicescan.h"
#include "error.h"
#include "eventsource.h"
#include "logging.h"
#include "remapdaemon.h"
#include "runguard.h"
#include "settings.h"
#include "virtualdevice.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

#include <csignal>
#include <memory>
#include <iostream>

#ifndef SC2REMAP_VERSION
#define SC2REMAP_VERSION "0.0.0"
#endif

LOGGING_CATEGORY(appMain, "main")

namespace {
  // -----------------------------------------------------------------------------------------------
  constexpr int SC2REMAP_ERROR_INVALID_ARGUMENTS = 2;
  constexpr int SC2REMAP_ERROR_FATAL = 3;
  constexpr int SC2REMAP_ERROR_ANOTHER_INST_RUNNING = 42;

  // -----------------------------------------------------------------------------------------------
  class Main : public QObject {};

  std::ostream& operator<<(std::ostream& os, const QString& s) {
    os << s.toStdString();
    return os;
  }

  struct print {
    template<typename T>
    auto& operator<<(const T& a) const { return std::cout << a; }
    ~print() { std::cout << std::endl; }
  };

  struct error {
    template<typename T>
    auto& operator<<(const T& a) const { return std::cerr << a; }
    ~error() { std::cerr << std::endl; }
  };

  void quit_signal_handler(int sig)
  {
    if (sig == SIGINT || sig == SIGTERM) {
      print() << "...";
      if (qApp) { QCoreApplication::quit(); }
    }
  }

  // -----------------------------------------------------------------------------------------------
  void printDeviceInfo()
  {
    const auto result = DeviceScan::getDevices();
    print() << QCoreApplication::applicationName() << " "
            << QCoreApplication::applicationVersion() << "; " << Main::tr("device scan") << std::endl;

    for (const auto& errmsg : result.errorMessages) {
      print() << "** " << Main::tr("Error: ") << errmsg;
    }

    print() << (!result.errorMessages.empty() ? "\n" : "")
            << Main::tr(" * Found %1 event devices. (%2 readable)")
                .arg(result.devices.size()).arg(result.numDevicesReadable);

    for (const auto& device : result.devices)
    {
      print() << "\n"
              << " +++ " << "event" << device.eventId << ": '" << device.name << "'";
      print() << "     " << "vendorId:  " << logging::hexId(device.vendorId);
      print() << "     " << "productId: " << logging::hexId(device.productId);
      print() << "     " << "busType:   " << logging::hexId(device.busType);
      print() << "     " << "phys:      " << device.phys;
      print() << "     " << "device:    " << device.deviceFile;
      print() << "     " << "keys:      " << (device.hasKeys ? "true" : "false");
      print() << "     " << "relative:  " << (device.hasRelativeEvents ? "true" : "false");
      print() << "     " << "readable:  " << (device.deviceReadable ? "true" : "false");
    }
  }

  // -----------------------------------------------------------------------------------------------
  struct Sc2RemapCmdLineParser
  {
    QCommandLineParser parser;

    const QCommandLineOption versionOption_ = {QStringList{ "v", "version"}, Main::tr("Print application version.")};
    const QCommandLineOption helpOption_ = {QStringList{ "h", "help"}, Main::tr("Show command line usage.")};
    const QCommandLineOption cfgFileOption_ = {QStringList{ "cfg" }, Main::tr("Set custom config file."), "file"};
    const QCommandLineOption deviceInfoOption_ = {QStringList{ "d", "device-scan"}, Main::tr("Print device-scan results.")};
    const QCommandLineOption logLvlOption_ = {QStringList{ "l", "log-level" }, Main::tr("Set log level (trc,dbg,inf,wrn,err)."), "lvl"};
    const QCommandLineOption keyboardOption_ = {QStringList{ "k", "keyboard" }, Main::tr("Keyboard event device id N (/dev/input/eventN)."), "N"};
    const QCommandLineOption mouseOption_ = {QStringList{ "m", "mouse" }, Main::tr("Mouse event device id N (/dev/input/eventN)."), "N"};

    // ---------------------------------------------------------------------------------------------
    Sc2RemapCmdLineParser()
    {
      parser.setApplicationDescription(Main::tr("Keyboard layer and mouse gesture remapping daemon."));
      parser.addOptions({versionOption_, helpOption_, cfgFileOption_, deviceInfoOption_,
                         logLvlOption_, keyboardOption_, mouseOption_});
    }

    // ---------------------------------------------------------------------------------------------
    bool versionOptionSet() const { return parser.isSet(versionOption_); }
    bool helpOptionSet() const { return parser.isSet(helpOption_); }
    bool deviceInfoOptionSet() const { return parser.isSet(deviceInfoOption_); }
    bool cfgFileOptionSet() const { return parser.isSet(cfgFileOption_); }
    auto cfgFileOptionValue() const { return parser.value(cfgFileOption_); }
    bool logLvlOptionSet() const { return parser.isSet(logLvlOption_); }
    auto logLvlOptionValue() const { return parser.value(logLvlOption_); }
    bool keyboardOptionSet() const { return parser.isSet(keyboardOption_); }
    auto keyboardOptionValue() const { return parser.value(keyboardOption_); }
    bool mouseOptionSet() const { return parser.isSet(mouseOption_); }
    auto mouseOptionValue() const { return parser.value(mouseOption_); }

    // ---------------------------------------------------------------------------------------------
    bool processArgs(const QStringList& args)
    {
      if (parser.parse(args)) { return true; }
      error() << parser.errorText();
      return false;
    }

    // ---------------------------------------------------------------------------------------------
    void printHelp()
    {
      print() << QCoreApplication::applicationName() << " "
              << QCoreApplication::applicationVersion() << std::endl;
      print() << "Usage: sc2remap [OPTION]..." << std::endl;
      print() << "<Options>";
      print() << "  -h, --help             " << helpOption_.description();
      print() << "  -v, --version          " << versionOption_.description();
      print() << "  --cfg FILE             " << cfgFileOption_.description();
      print() << "  -d, --device-scan      " << deviceInfoOption_.description();
      print() << "  -l, --log-level LEVEL  " << logLvlOption_.description();
      print() << "  -k, --keyboard N       " << keyboardOption_.description();
      print() << "  -m, --mouse N          " << mouseOption_.description();
      print() << "\n" << Main::tr("Without -k and -m the keyboard and mouse are identified by "
                                  "their first events:\npress and release any key, then move the mouse.");
    }
  };

  // -----------------------------------------------------------------------------------------------
  bool parseEventId(const QString& value, int& eventId)
  {
    bool ok = false;
    eventId = value.toInt(&ok);
    return ok && eventId >= 0;
  }

  // -----------------------------------------------------------------------------------------------
  std::unique_ptr<RoleResolver> createResolver(int keyboardId, int mouseId)
  {
    if (keyboardId >= 0 && mouseId >= 0) {
      return std::make_unique<ExplicitRoleResolver>(DeviceScan::eventDevicePath(keyboardId),
                                                    DeviceScan::eventDevicePath(mouseId));
    }

    const auto scanResult = DeviceScan::getDevices();
    for (const auto& errmsg : scanResult.errorMessages) {
      logWarning(appMain) << errmsg;
    }

    QStringList candidates;
    for (const auto& device : scanResult.devices) {
      candidates.push_back(device.deviceFile);
    }
    return std::make_unique<SignatureRoleResolver>(SignatureRoleResolver::openCandidates(candidates));
  }
} // end anonymous namespace


// -------------------------------------------------------------------------------------------------
int main(int argc, char *argv[])
{
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("sc2remap");
  QCoreApplication::setApplicationVersion(SC2REMAP_VERSION);

  QString configFile;
  int keyboardId = -1;
  int mouseId = -1;
  {
    Sc2RemapCmdLineParser parser;
    if (!parser.processArgs(QCoreApplication::arguments())) {
      return SC2REMAP_ERROR_INVALID_ARGUMENTS;
    }

    if (parser.helpOptionSet())
    {
      parser.printHelp();
      return 0;
    }

    // Print version information, if option is set
    if (parser.versionOptionSet())
    {
      print() << QCoreApplication::applicationName() << " " << QCoreApplication::applicationVersion();
      print() << "  - qt-version: (build: " << QT_VERSION_STR << ", runtime: " << qVersion() << ")";
      return 0;
    }

    // Print device information if option is set
    if (parser.deviceInfoOptionSet())
    {
      printDeviceInfo();
      return 0;
    }

    if (parser.cfgFileOptionSet()) {
      configFile = parser.cfgFileOptionValue();
    }

    if (parser.logLvlOptionSet()) {
      const auto lvl = logging::levelFromName(parser.logLvlOptionValue());
      if (lvl != logging::level::unknown) {
        logging::setCurrentLevel(lvl);
        logDebug(appMain) << Main::tr("Log level set to '%1'")
                             .arg(logging::levelToString(logging::currentLevel()));
      } else {
        error() << Main::tr("Cannot set log level, unknown level: '%1'").arg(parser.logLvlOptionValue());
        return SC2REMAP_ERROR_INVALID_ARGUMENTS;
      }
    }

    if (parser.keyboardOptionSet() != parser.mouseOptionSet()) {
      error() << Main::tr("Keyboard (-k) and mouse (-m) must be given together.");
      return SC2REMAP_ERROR_INVALID_ARGUMENTS;
    }

    if (parser.keyboardOptionSet()
        && (!parseEventId(parser.keyboardOptionValue(), keyboardId)
            || !parseEventId(parser.mouseOptionValue(), mouseId)))
    {
      error() << Main::tr("Invalid event device id: '%1', '%2'")
                 .arg(parser.keyboardOptionValue(), parser.mouseOptionValue());
      return SC2REMAP_ERROR_INVALID_ARGUMENTS;
    }
  }

  const auto settings = configFile.isEmpty() ? std::make_unique<Settings>()
                                              : std::make_unique<Settings>(configFile);
  if (!settings->isValid())
  {
    for (const auto& msg : settings->errorMessages()) {
      error() << msg;
    }
    return SC2REMAP_ERROR_INVALID_ARGUMENTS;
  }

  RunGuard guard(RunGuard::defaultLockFilePath(QCoreApplication::applicationName()));
  if (!guard.tryToRun())
  {
    if (guard.lockedByOther()) {
      error() << Main::tr("Another application instance is already running (%1). Exiting.")
                 .arg(guard.lockFilePath());
      return SC2REMAP_ERROR_ANOTHER_INST_RUNNING;
    }
    logError(appMain) << Error::fatal(guard.errorString()).toString();
    return SC2REMAP_ERROR_FATAL;
  }

  Error err;
  auto virtualDevice = VirtualDevice::create(settings->virtualDeviceOptions(), err);
  if (!virtualDevice)
  {
    logError(appMain) << err.toString();
    return SC2REMAP_ERROR_FATAL;
  }

  RemapDaemon::Options options;
  options.layerKey = settings->layerKey();
  options.defaultTarget = settings->defaultTarget();
  options.keyMap = settings->keyMap();
  options.gestures = settings->gestureConfig();

  RemapDaemon daemon(std::move(options), createResolver(keyboardId, mouseId), virtualDevice);
  QObject::connect(&daemon, &RemapDaemon::fatalError, &app, [](){
    QCoreApplication::exit(SC2REMAP_ERROR_FATAL);
  });

  signal(SIGINT, quit_signal_handler);
  signal(SIGTERM, quit_signal_handler);

  QTimer::singleShot(0, &daemon, &RemapDaemon::start);
  const int result = app.exec();
  logDebug(appMain) << Main::tr("Exiting with %1").arg(result);
  return result;
}
