#include "DaemonCreator.hpp"

namespace sshed {
int DaemonCreator::create(bool parentExit, string childPidFile) {
  pid_t pid = fork();
  if (pid < 0) {
    STFATAL << "Failed to fork: " << strerror(errno);
  }

  if (pid > 0) {
    if (parentExit) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  if (setsid() < 0) {
    exit(EXIT_FAILURE);
  }
  signal(SIGHUP, SIG_IGN);

  pid = fork();
  if (pid < 0) {
    exit(EXIT_FAILURE);
  }
  if (pid > 0) {
    exit(EXIT_SUCCESS);
  }

  if (childPidFile != "") {
    int pidFilehandle =
        open(childPidFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (pidFilehandle == -1) {
      STFATAL << "Error opening pidfile for writing: " << childPidFile;
    }
    string pid_str = to_string(getpid()) + "\n";
    FATAL_FAIL(write(pidFilehandle, pid_str.c_str(), pid_str.length()));
    FATAL_FAIL(close(pidFilehandle));
  }

  FATAL_FAIL(chdir("/"));

  int fd = open("/dev/null", O_WRONLY);
  FATAL_FAIL(fd);
  FATAL_FAIL(dup2(fd, STDOUT_FILENO));
  FATAL_FAIL(dup2(fd, STDERR_FILENO));

  int fd2 = open("/dev/null", O_RDONLY);
  FATAL_FAIL(fd2);
  FATAL_FAIL(dup2(fd2, STDIN_FILENO));

  return CHILD;
}
}  // namespace sshed
