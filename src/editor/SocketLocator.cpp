#include "SocketLocator.hpp"

namespace sshed {
optional<string> SocketLocator::find(const string& socketAddress) {
  string address = socketAddress;
  if (address.empty()) {
    const char* envAddress = ::getenv(SOCKET_ENVIRONMENT_VARIABLE.c_str());
    if (envAddress == NULL || envAddress[0] == '\0') {
      LOG(ERROR) << "No " << SOCKET_ENVIRONMENT_VARIABLE
                 << " environment variable and no socket address passed via "
                    "command line.";
      return nullopt;
    }
    address = envAddress;
  }

  struct stat st;
  if (::stat(address.c_str(), &st) == -1) {
    LOG(ERROR) << "Socket address " << address
               << " does not exist: " << strerror(errno);
    return nullopt;
  }
  if (S_ISDIR(st.st_mode)) {
    LOG(WARNING) << "Socket address " << address
                 << " is a directory, not a file.";
    string socketFile = address + "/socket";
    if (::stat(socketFile.c_str(), &st) == -1) {
      LOG(ERROR) << "Socket directory " << address
                 << " does not contain a valid socket file.";
      return nullopt;
    }
    address = socketFile;
  }
  if (!S_ISSOCK(st.st_mode)) {
    LOG(ERROR) << address << " is not a socket.";
    return nullopt;
  }
  if (st.st_uid != ::getuid()) {
    LOG(ERROR) << "Socket " << address << " is not owned by the current user.";
    return nullopt;
  }
  if ((st.st_mode & 07777) != (S_IRUSR | S_IWUSR)) {
    LOG(ERROR) << "Socket " << address << " access is too permissive.";
    return nullopt;
  }
  VLOG(1) << "Socket found: " << address;
  return address;
}
}  // namespace sshed
