#include <cxxopts.hpp>

#include "DaemonCreator.hpp"
#include "LogHandler.hpp"
#include "MicroServer.hpp"
#include "ResourceStore.hpp"
#include "ServerConfigLoader.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"

using namespace ms;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ms::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ms::InterruptSignalHandler);
  // A peer that vanishes mid-write must not kill the server
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("msserver",
                           "Static web pages and a websocket line console for "
                           "a single output pin");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "HTTP port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("wsport", "Websocket port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("webroot", "Directory served over HTTP",
         cxxopts::value<string>()->default_value(""))  //
        ("password", "Password for the websocket console",
         cxxopts::value<string>()->default_value(""))  //
        ("gpio", "File driving the output pin (simulated if unset)",
         cxxopts::value<string>()->default_value(""))  //
        ("daemon", "Daemonize the server")             //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/msserver.pid"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "msserver version " << MS_VERSION << endl;
      exit(0);
    }

    ServerConfig config = ServerConfigLoader::defaults();

    LogSettings logSettings;
    logSettings.toStdout = result.count("logtostdout") > 0;
    logSettings.redirectStderr = !logSettings.toStdout;

    if (result.count("cfgfile")) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        CLOG(INFO, "stdout") << "Invalid config file: " << cfgfilename << endl;
        exit(1);
      }
      ServerConfigLoader::applyIni(ini, &config);
      LogHandler::loadDebugSection(ini, &logSettings);
    }

    // The command line wins over the config file
    if (result.count("verbose")) {
      logSettings.verboseLevel = result["verbose"].as<int>();
    }
    if (result.count("port")) {
      config.mutable_http_endpoint()->set_port(result["port"].as<int>());
    }
    if (result.count("wsport")) {
      config.mutable_websocket_endpoint()->set_port(result["wsport"].as<int>());
    }
    if (result.count("bindip")) {
      ServerConfigLoader::setBindIp(result["bindip"].as<string>(), &config);
    }
    if (result.count("webroot")) {
      config.set_web_root(result["webroot"].as<string>());
    }
    if (result.count("password")) {
      config.set_password(result["password"].as<string>());
    }
    if (result.count("gpio")) {
      config.set_peripheral_path(result["gpio"].as<string>());
    }

    ServerConfigLoader::validate(config);

    // The daemon changes directory to /
    config.set_web_root(fs::absolute(config.web_root()).string());
    if (!config.peripheral_path().empty()) {
      config.set_peripheral_path(
          fs::absolute(config.peripheral_path()).string());
    }

    if (result.count("daemon")) {
      DaemonCreator::create(true, result["pidfile"].as<string>());
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    string logPath = LogHandler::apply(logSettings, &defaultConf);
    LogHandler::nameMainThread();
    LOG(INFO) << "msserver " << MS_VERSION << " logging to " << logPath;

    if (config.password().empty()) {
      LOG(WARNING) << "No password configured, the websocket console accepts "
                      "any password";
    }
    if (!fs::is_directory(config.web_root())) {
      LOG(WARNING) << "Web root " << config.web_root()
                   << " is not a directory, every page will be 404";
    }

    std::shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    std::shared_ptr<ResourceStore> resourceStore(
        new DirectoryResourceStore(config.web_root()));
    std::shared_ptr<Peripheral> peripheral = createPeripheral(config);

    MicroServer microServer(tcpSocketHandler, config, resourceStore,
                            peripheral);
    if (!result.count("daemon")) {
      CLOG(INFO, "stdout")
          << "Serving " << config.web_root() << " at "
          << MicroServer::endpointUrl("http", config.http_endpoint())
          << ", websocket console at "
          << MicroServer::endpointUrl("ws", config.websocket_endpoint())
          << endl;
    }
    microServer.run();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    LOG(ERROR) << "msserver failed: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
}
