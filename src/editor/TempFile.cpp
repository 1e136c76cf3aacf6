#include "TempFile.hpp"

#include "DataStream.hpp"

namespace sshed {
TempFile::TempFile(const string& directory, const string& prefix) : fd(-1) {
  string pattern = directory;
  if (!pattern.empty() && pattern.back() != '/') {
    pattern += "/";
  }
  pattern += prefix + "XXXXXX";
  vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  fd = ::mkstemp(&buf[0]);
  if (fd == -1) {
    throw runtime_error("Could not create temp file " + pattern + ": " +
                        strerror(errno));
  }
  path = string(&buf[0]);
  FATAL_FAIL(::fchmod(fd, S_IRUSR | S_IWUSR));
  VLOG(2) << "Created temp file " << path;
}

TempFile::~TempFile() {
  closeFd();
  if (::unlink(path.c_str()) == -1 && errno != ENOENT) {
    LOG(WARNING) << "Could not remove temp file " << path << ": "
                 << strerror(errno);
  }
}

void TempFile::closeFd() {
  if (fd >= 0) {
    FATAL_FAIL(::close(fd));
    fd = -1;
  }
}

string TempFile::readContents() const {
  auto contents = readFileContents(path);
  if (!contents) {
    throw runtime_error("Temp file disappeared: " + path);
  }
  return *contents;
}

void TempFile::writeContents(const string& contents) {
  if (fd < 0) {
    STFATAL << "Tried to write to a closed temp file: " << path;
  }
  FATAL_FAIL(::ftruncate(fd, 0));
  FATAL_FAIL(::lseek(fd, 0, SEEK_SET));
  FdDataSink sink(fd);
  sink.write(contents);
}

TempDirectory::TempDirectory(const string& parent, const string& prefix) {
  string pattern = parent;
  if (!pattern.empty() && pattern.back() != '/') {
    pattern += "/";
  }
  pattern += prefix + "XXXXXX";
  vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (::mkdtemp(&buf[0]) == NULL) {
    throw runtime_error("Could not create temp directory " + pattern + ": " +
                        strerror(errno));
  }
  path = string(&buf[0]);
  // mkdtemp is subject to the umask, which may have dropped the search bit
  FATAL_FAIL(::chmod(path.c_str(), S_IRWXU));
  VLOG(1) << "Created temp directory " << path;
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove temp directory " << path << ": "
                 << ec.message();
  }
}

string sanitizeFilename(const string& filename) {
  string name = filename;
  size_t slash = name.find_last_of('/');
  if (slash != string::npos) {
    name = name.substr(slash + 1);
  }
  for (auto& c : name) {
    if (c == '\0' || iscntrl((unsigned char)c)) {
      c = '_';
    }
  }
  if (name.empty() || name == "." || name == "..") {
    name = "file";
  }
  // Keep room for the random suffix within NAME_MAX
  if (name.length() > 200) {
    name = name.substr(0, 200);
  }
  return name;
}

optional<string> readFileContents(const string& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    if (errno == ENOENT) {
      return nullopt;
    }
    throw runtime_error("Could not open " + path + ": " + strerror(errno));
  }
  string contents;
  char buf[SOCKET_READ_CHUNK_SIZE];
  FdDataSource source(fd);
  try {
    while (true) {
      size_t n = source.read(buf, sizeof(buf));
      if (n == 0) {
        break;
      }
      contents.append(buf, n);
    }
  } catch (const std::runtime_error& ex) {
    FATAL_FAIL(::close(fd));
    throw runtime_error("Could not read " + path + ": " + ex.what());
  }
  FATAL_FAIL(::close(fd));
  return contents;
}

void writeFileContents(const string& path, const string& contents) {
  string target = path;
  struct stat existing;
  bool exists = (::stat(path.c_str(), &existing) == 0);
  if (exists) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (!ec) {
      target = resolved.string();
    }
  }
  fs::path directory = fs::path(target).parent_path();
  if (directory.empty()) {
    directory = ".";
  }
  string pattern =
      (directory / (fs::path(target).filename().string() + ".sshed-XXXXXX"))
          .string();
  vector<char> tempPath(pattern.begin(), pattern.end());
  tempPath.push_back('\0');
  int fd = ::mkstemp(&tempPath[0]);
  if (fd == -1) {
    throw runtime_error("Could not create a file beside " + path + ": " +
                        strerror(errno));
  }

  try {
    FdDataSink sink(fd);
    sink.write(contents);
    if (exists) {
      if ((existing.st_uid != ::geteuid() || existing.st_gid != ::getegid()) &&
          ::fchown(fd, existing.st_uid, existing.st_gid) == -1) {
        throw runtime_error(string("cannot keep the owner: ") +
                            strerror(errno));
      }
      if (::fchmod(fd, existing.st_mode & 07777) == -1) {
        throw runtime_error(string("cannot keep the mode: ") +
                            strerror(errno));
      }
    }
    if (::fsync(fd) == -1) {
      throw runtime_error(string("sync failed: ") + strerror(errno));
    }
  } catch (const std::runtime_error& ex) {
    FATAL_FAIL(::close(fd));
    FATAL_FAIL(::unlink(&tempPath[0]));
    throw runtime_error("Could not write " + path + ": " + ex.what());
  }
  FATAL_FAIL(::close(fd));

  if (::rename(&tempPath[0], target.c_str()) == -1) {
    auto renameErrno = errno;
    FATAL_FAIL(::unlink(&tempPath[0]));
    throw runtime_error("Could not replace " + path + ": " +
                        strerror(renameErrno));
  }
}
}  // namespace sshed
