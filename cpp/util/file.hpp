#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <kj/common.h>
#include <kj/function.h>
#include <string>
#include <vector>

namespace util {

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // A non-owning pointer to a sequence of bytes, usually representing a part of
  // a file.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // A ChunkReceiver is a function that should be called one or more times with
  // a valid Chunk. An empty Chunk represents EOF.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Subsequent calls to this function produce consecutive Chunks from some
  // source. On EOF, an empty Chunk is returned.
  using ChunkProducer = kj::Function<Chunk()>;

  // Lists all the files in a directory.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Reads the file specified by path in chunks.
  static ChunkProducer Read(const std::string& path);

  // Reads the whole file specified by path.
  static std::string ReadAll(const std::string& path);

  // Returns a receiver that writes to the given file, the file ends when an
  // empty chunk is received, and finalizes the write when destroyed.
  static ChunkReceiver Write(const std::string& path, bool overwrite = false,
                             bool exist_ok = true);

  // Writes the whole content to the given file.
  static void WriteAll(const std::string& path, Chunk content,
                       bool overwrite = false, bool exist_ok = true);
  static void WriteAll(const std::string& path, const std::string& content,
                       bool overwrite = false, bool exist_ok = true) {
    WriteAll(path,
             kj::arrayPtr(reinterpret_cast<const kj::byte*>(  // NOLINT
                              content.data()),
                          content.size()),
             overwrite, exist_ok);
  }

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created,
  // prefix is prepended to the random part of its name.
  explicit TempDir(const std::string& base, const std::string& prefix = "");

  // Returns the absolute path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept : moved_(true) {
    *this = std::move(other);
  }
  TempDir& operator=(TempDir&& other) noexcept {
    Release();
    path_ = std::move(other.path_);
    moved_ = other.moved_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  // Removes the folder unless it was moved away.
  void Release() noexcept;

  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
