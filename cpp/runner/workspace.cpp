#include "runner/workspace.hpp"

#include <kj/debug.h>

#include "util/file.hpp"

namespace runner {

std::string SanitizeAssetName(const std::string& name) {
  if (name.find('\0') != std::string::npos) return "";
  size_t last = name.find_last_not_of('/');
  if (last == std::string::npos) return "";
  std::string base = util::File::BaseName(name.substr(0, last + 1));
  if (base == "." || base == "..") return "";
  return base;
}

std::string Materialize(const std::string& dir, const std::string& source_name,
                        const ExecutionRequest& request) {
  std::string source_path = util::File::JoinPath(dir, source_name);
  util::File::WriteAll(source_path, request.source_code, true);
  for (const Asset& asset : request.assets) {
    std::string name = SanitizeAssetName(asset.name);
    if (name.empty()) {
      KJ_LOG(WARNING, "Dropping asset with an invalid name", asset.name);
      continue;
    }
    if (name == source_name) {
      KJ_LOG(WARNING, "Dropping asset that would replace the source", name);
      continue;
    }
    util::File::WriteAll(util::File::JoinPath(dir, name), asset.data, true);
  }
  return source_path;
}

}  // namespace runner
