#ifndef __SSHED_TEMP_FILE__
#define __SSHED_TEMP_FILE__

#include "Headers.hpp"

namespace sshed {
/**
 * @brief A uniquely named file that is removed when this object goes away.
 */
class TempFile {
 public:
  /**
   * @brief Creates `<directory>/<prefix>XXXXXX` with mode 0600 and keeps it
   * open for reading and writing.
   * @throws std::runtime_error if the file cannot be created.
   */
  TempFile(const string& directory, const string& prefix);
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const string& getPath() const { return path; }

  /** @brief The open descriptor, or -1 after closeFd(). */
  int getFd() const { return fd; }

  /** @brief Closes the descriptor but keeps the file. */
  void closeFd();

  /** @brief Reads the whole file from disk by path. */
  string readContents() const;

  /** @brief Replaces the file contents through the open descriptor. */
  void writeContents(const string& contents);

 protected:
  string path;
  int fd;
};

/**
 * @brief A private directory (mode 0700) removed with everything in it when
 * this object goes away.
 */
class TempDirectory {
 public:
  /**
   * @brief Creates `<parent>/<prefix>XXXXXX`.
   * @throws std::runtime_error if the directory cannot be created.
   */
  TempDirectory(const string& parent, const string& prefix);
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const string& getPath() const { return path; }

 protected:
  string path;
};

/**
 * @brief Reduces a peer supplied file name to a safe temp file prefix.
 */
string sanitizeFilename(const string& filename);

/**
 * @brief Reads a whole file.
 * @return nullopt if the file does not exist.
 * @throws std::runtime_error for any other failure.
 */
optional<string> readFileContents(const string& path);

/**
 * @brief Replaces the contents of @p path, creating it if needed.
 *
 * The new contents are written and synced to a file in the same directory
 * which is then renamed over the target, so a failed write leaves the old
 * file as it was. Symlinks are followed and the mode and owner of an
 * existing file are kept. New files are created with mode 0600.
 * @throws std::runtime_error on failure, or when the owner of an existing
 * file cannot be kept.
 */
void writeFileContents(const string& path, const string& contents);
}  // namespace sshed

#endif  // __SSHED_TEMP_FILE__
