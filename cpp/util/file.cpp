#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/io.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr int kCreateAttempts = 16;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

std::string UniqueName(const std::string& prefix, const std::string& suffix) {
  static std::atomic<uint64_t> counter{0};
  thread_local std::mt19937_64 rng{std::random_device{}()};
  char random[17] = {};
  snprintf(random, sizeof(random), "%016llx",  // NOLINT
           static_cast<unsigned long long>(rng()));
  return prefix + "-" + std::to_string(getpid()) + "-" +
         std::to_string(counter++) + "-" + random + suffix;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const std::string& content) {
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos,  // NOLINT
                            content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[64 * 1024];
  ssize_t amount;
  while ((amount = read(fd, buf, sizeof(buf)))) {  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    content.append(buf, amount);
  }
  return content;
}

std::string File::CreateUnique(const std::string& dir,
                               const std::string& prefix,
                               const std::string& suffix,
                               const std::string& content) {
  std::string path;
  kj::AutoCloseFd fd;
  for (int attempt = 0; attempt < kCreateAttempts; attempt++) {
    path = JoinPath(dir, UniqueName(prefix, suffix));
    fd = kj::AutoCloseFd(open(path.c_str(),  // NOLINT
                              O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                              S_IRUSR | S_IWUSR));
    if (fd.get() != -1 || errno != EEXIST) break;
  }
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Create " + path);
  }
  int err = OsWriteAll(fd, content);
  if (err != 0) {
    fd = nullptr;
    OsRemove(path);
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
  return path;
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

int File::TryRemove(const std::string& path) {
  return OsRemove(path) ? 0 : errno;
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, first.back()) != nullptr) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (!moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([this]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
