#include "SubprocessUtils.hpp"

namespace sshed {
int SubprocessUtils::runAndWait(const vector<string>& argv) {
  if (argv.empty()) {
    LOG(ERROR) << "Tried to run an empty command";
    return -1;
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    char** argsArray = new char*[argv.size() + 1];
    for (size_t a = 0; a < argv.size(); a++) {
      argsArray[a] = strdup(argv[a].c_str());
    }
    argsArray[argv.size()] = NULL;
    execvp(argsArray[0], argsArray);

    // Only reached when exec fails; the logger is not safe after fork
    fprintf(stderr, "Could not run %s: %s\n", argsArray[0], strerror(errno));
    _exit(127);
  } else if (pid > 0) {
    VLOG(1) << "Started " << argv[0] << " as pid " << pid;
    int status;
    while (waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) {
        LOG(ERROR) << "waitpid failed: " << strerror(errno);
        return -1;
      }
    }
    if (WIFEXITED(status)) {
      int exitCode = WEXITSTATUS(status);
      VLOG(1) << argv[0] << " exited with " << exitCode;
      return exitCode == 127 ? -1 : exitCode;
    }
    if (WIFSIGNALED(status)) {
      LOG(WARNING) << argv[0] << " killed by signal " << WTERMSIG(status);
      return 128 + WTERMSIG(status);
    }
    return -1;
  } else {
    LOG(ERROR) << "Failed to fork: " << strerror(errno);
    return -1;
  }
}

optional<string> SubprocessUtils::findExecutable(const string& name) {
  if (name.empty()) {
    return nullopt;
  }
  if (name.find('/') != string::npos) {
    if (::access(name.c_str(), X_OK) == 0) {
      return name;
    }
    return nullopt;
  }
  const char* pathEnv = ::getenv("PATH");
  if (pathEnv == NULL) {
    return nullopt;
  }
  for (const string& dir : split(pathEnv, ':')) {
    if (dir.empty()) {
      continue;
    }
    string candidate = dir + "/" + name;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return nullopt;
}
}  // namespace sshed
