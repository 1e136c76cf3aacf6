#include <cxxopts.hpp>

#include "EditClient.hpp"
#include "EditorChooser.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "SocketLocator.hpp"
#include "TempFile.hpp"

using namespace sshed;

namespace {
int editLocally(const string& path) {
  LOG(WARNING) << "Using a host side text editor instead.";
  shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
  EditorChooser editorChooser(subprocessUtils);
  vector<string> argv;
  try {
    argv = editorChooser.chooseEditor();
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << re.what();
    return 1;
  }
  argv.push_back(path);
  int status = subprocessUtils->runAndWait(argv);
  return status < 0 ? 1 : status;
}

int editRemotely(const string& path, const string& socketPath) {
  shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
  int socketFd = socketHandler->connect(SocketEndpoint(socketPath));
  if (socketFd < 0) {
    LOG(ERROR) << "Could not connect to " << socketPath << ": "
               << strerror(GetErrno());
    return editLocally(path);
  }

  int exitCode = 1;
  try {
    auto content = readFileContents(path);
    if (!content) {
      VLOG(1) << path << " does not exist yet";
      content = string();
    }
    EditClient client(socketHandler, socketFd);
    auto edited =
        client.requestEdit(fs::path(path).filename().string(), *content);
    if (edited) {
      writeFileContents(path, *edited);
      VLOG(1) << "Wrote " << edited->length() << " bytes to " << path;
    } else {
      VLOG(1) << "No changes, not modifying " << path;
    }
    exitCode = 0;
  } catch (const ConnectionClosedError& cce) {
    LOG(ERROR) << "Lost the connection to sshed-agent: " << cce.what();
  } catch (const MalformedPacketError& mpe) {
    LOG(ERROR) << "Invalid reply from sshed-agent: " << mpe.what();
  } catch (const MalformedDiffError& mde) {
    LOG(ERROR) << "Could not apply the changes to " << path << ": "
               << mde.what();
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << re.what();
  }
  socketHandler->close(socketFd);
  if (exitCode != 0) {
    LOG(ERROR) << path << " was left unchanged";
  }
  return exitCode;
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  HandleTerminate();

  cxxopts::Options options(
      "sshed", "Edit a file on this machine with the editor of the machine "
               "running sshed-agent");
  options.positional_help("FILE");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("d,debug", "Run in debug mode (same as --verbose 1)")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("a,socketaddress", "Use a specific socket file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("file", "File to edit", cxxopts::value<std::string>())  //
        ;
    options.parse_positional({"file"});

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sshed version " << SSHED_VERSION << endl;
      exit(0);
    }
    if (!result.count("file")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    int verbose = result["verbose"].as<int>();
    if (result.count("debug")) {
      verbose = max(verbose, 1);
    }
    LogHandler::setupConsoleLogging(&defaultConf, verbose > 0);
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setVerbosity(verbose);

    ::umask(USER_ONLY_UMASK);

    string path = result["file"].as<string>();
    auto socketPath =
        SocketLocator::find(result["socketaddress"].as<string>());
    if (!socketPath) {
      return editLocally(path);
    }
    return editRemotely(path, *socketPath);
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
