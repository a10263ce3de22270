#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Creates a new file with a name that no other call (in this or any other
  // process) can produce, of the form dir/prefix-PID-COUNTER-RANDOMsuffix,
  // and writes content to it. The file is only readable and writable by the
  // owner. If the content cannot be written completely the file is removed.
  // Returns the path of the new file.
  static std::string CreateUnique(const std::string& dir,
                                  const std::string& prefix,
                                  const std::string& suffix,
                                  const std::string& content);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Removes a file, returning errno on failure and 0 on success.
  static int TryRemove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path is a directory.
  static bool IsDirectory(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
