#include <cxxopts.hpp>

#include "AgentConfig.hpp"
#include "DaemonCreator.hpp"
#include "EditServer.hpp"
#include "EditorChooser.hpp"
#include "EnvironmentVariable.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "TempFile.hpp"

using namespace sshed;

namespace {
EditServer* runningServer = NULL;

void haltHandler(int sig) {
  if (runningServer) {
    runningServer->shutdown();
  }
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  HandleTerminate();

  cxxopts::Options options("sshed-agent",
                           "Opens files sent by sshed in a local editor");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("a,socketaddress", "Give the socket a specific filename",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell",
         "Shell to write the SSHED_SOCK command for (default: from $SHELL)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("b,bash", "Shortcut for --shell bash")             //
        ("c,csh", "Shortcut for --shell csh")               //
        ("fish", "Shortcut for --shell fish")               //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("max-connections", "Number of files that can be edited at once",
         cxxopts::value<int>()->default_value("8"))  //
        ("editor", "Editor command, overrides EDITOR",
         cxxopts::value<std::string>()->default_value(""))  //
        ("daemon", "Run in the background")                 //
        ("pidfile", "Location of the pid file when running as a daemon",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sshed-agent version " << SSHED_VERSION << endl;
      exit(0);
    }

    AgentConfig config;
    if (result.count("cfgfile")) {
      try {
        config.loadFile(result["cfgfile"].as<string>());
      } catch (const std::runtime_error& re) {
        CLOG(ERROR, "stdout") << re.what() << endl;
        exit(1);
      }
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("socketaddress")) {
      config.socketAddress = result["socketaddress"].as<string>();
    }
    if (result.count("max-connections")) {
      config.maxConnections = result["max-connections"].as<int>();
      if (config.maxConnections < 1) {
        CLOG(ERROR, "stdout") << "--max-connections must be at least 1"
                              << endl;
        exit(1);
      }
    }
    if (result.count("editor")) {
      config.editor = result["editor"].as<string>();
    }

    int shellOptions = int(result.count("shell")) + int(result.count("bash")) +
                       int(result.count("csh")) + int(result.count("fish"));
    if (shellOptions > 1) {
      CLOG(ERROR, "stdout")
          << "Only one of --shell, --bash, --csh and --fish may be given"
          << endl;
      exit(1);
    }
    string shell = EnvironmentVariable::defaultShell();
    if (result.count("shell")) {
      shell = result["shell"].as<string>();
    } else if (result.count("bash")) {
      shell = "bash";
    } else if (result.count("csh")) {
      shell = "csh";
    } else if (result.count("fish")) {
      shell = "fish";
    }

    ::umask(USER_ONLY_UMASK);
    ::signal(SIGPIPE, SIG_IGN);

    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    EditServerOptions serverOptions;
    try {
      serverOptions.editorCommand =
          EditorChooser(subprocessUtils).chooseEditor(config.editor);
    } catch (const std::runtime_error& re) {
      CLOG(ERROR, "stdout") << re.what() << endl;
      exit(1);
    }

    TempDirectory workDirectory(GetTempDirectory(), "sshed-");
    string socketAddress = config.socketAddress.empty()
                               ? workDirectory.getPath()
                               : config.socketAddress;
    EnvironmentVariable socketVariable(SOCKET_ENVIRONMENT_VARIABLE,
                                       socketAddress);
    CLOG(INFO, "stdout") << socketVariable.generate(shell) << endl;
    if (socketAddress == workDirectory.getPath()) {
      socketAddress += "/socket";
    }

    if (result.count("daemon")) {
      if (DaemonCreator::create(true, result["pidfile"].as<string>()) == -1) {
        STFATAL << "Error creating daemon: " << strerror(GetErrno());
      }
    }

    if (result.count("logtostdout")) {
      LogHandler::setupConsoleLogging(&defaultConf, true);
    } else {
      LogHandler::setupLogFiles(&defaultConf, config.logDirectory,
                                "sshed-agent", false, false, true,
                                config.logSize);
    }
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setVerbosity(config.verbose);
    el::Helpers::setThreadName("sshed-agent-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (!EditorChooser::isGraphicalSession()) {
      LOG(INFO) << "No graphical session detected, the editor will run in "
                   "this terminal";
    }

    serverOptions.workDirectory = workDirectory.getPath();
    serverOptions.maxConnections = config.maxConnections;
    serverOptions.contextLines = config.contextLines;

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    EditServer editServer(socketHandler, SocketEndpoint(socketAddress),
                          subprocessUtils, serverOptions);
    runningServer = &editServer;
    ::signal(SIGINT, haltHandler);
    ::signal(SIGTERM, haltHandler);
    LOG(INFO) << "Socket opened at " << socketAddress
              << ". Serving requests.";
    editServer.run();
    runningServer = NULL;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << re.what();
    el::Helpers::uninstallPreRollOutCallback();
    return 1;
  }

  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
