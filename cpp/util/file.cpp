#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  KJ_ASSERT(nftw(path.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) {
                   if (typeflags != FTW_F) return 0;
                   files.emplace_back(fpath);
                   return 0;
                 },
                 64, FTW_DEPTH | FTW_PHYS) != -1);
  std::vector<std::string> ret = std::move(files);
  files.clear();
  std::sort(ret.begin(), ret.end());
  return ret;
};

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back(0);
  if (mkdtemp(data.data()) == nullptr) return "";
  char resolved[PATH_MAX] = {};
  if (realpath(data.data(), resolved) == nullptr) return "";
  return resolved;
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back(0);
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  // This may not have the desired effect if src is a symlink.
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkProducer OsRead(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return [fd = std::move(fd), path,
          buf = std::array<kj::byte, util::kChunkSize>()]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    while ((amount = read(fd, buf.data(), util::kChunkSize))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      return util::File::Chunk(buf.data(), amount);
    }
    if (amount == -1) {
      fd = nullptr;
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite,
                                  bool exist_ok) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>();
  auto finalize = [done = done.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::Remove(temp_file); });
    }
  };
  return [fd = std::move(fd), temp_file, path, overwrite, exist_ok,
          done = std::move(done),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      if (fsync(fd) == -1 ||
          OsAtomicMove(temp_file, path, overwrite, exist_ok)) {
        throw std::system_error(errno, std::system_category(), "Write " + path);
      }
      fd = kj::AutoCloseFd();
      return;
    }
    size_t pos = 0;
    while (pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + pos,  // NOLINT
                              chunk.size() - pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        fd = nullptr;
        throw std::system_error(errno, std::system_category(),
                                "write " + temp_file);
      }
      pos += written;
    }
  };
}

}  // namespace

namespace util {
std::vector<std::string> File::ListFiles(const std::string& path) {
  MakeDirs(path);
  return OsListFiles(path);
}

File::ChunkProducer File::Read(const std::string& path) { return OsRead(path); }

std::string File::ReadAll(const std::string& path) {
  auto producer = Read(path);
  std::string content;
  Chunk chunk;
  while ((chunk = producer()).size()) {
    content.append(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  MakeDirs(BaseDir(path));
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return [](Chunk chunk) {};
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite, exist_ok);
}

void File::WriteAll(const std::string& path, Chunk content, bool overwrite,
                    bool exist_ok) {
  auto receiver = Write(path, overwrite, exist_ok);
  for (size_t pos = 0; pos < content.size(); pos += kChunkSize) {
    receiver(content.slice(pos, std::min<size_t>(content.size(),
                                                 pos + kChunkSize)));
  }
  receiver(Chunk());
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
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

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() { Release(); }
void TempDir::Release() noexcept {
  if (moved_) return;
  moved_ = true;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() { File::RemoveTree(path_); })) {
    KJ_LOG(WARNING, "Failed to remove temporary directory", path_,
           exc->getDescription());
  }
}

}  // namespace util
