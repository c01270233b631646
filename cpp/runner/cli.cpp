#include "runner/cli.hpp"

#include <kj/debug.h>

#include "runner/output_parser.hpp"
#include "util/file.hpp"

namespace runner {

ExecutionRequest LoadRequest(const std::string& source_path,
                             const std::vector<std::string>& asset_paths,
                             bool run_foreground) {
  ExecutionRequest request;
  request.source_code = util::File::ReadAll(source_path);
  request.run_foreground = run_foreground;
  for (const std::string& path : asset_paths) {
    request.assets.push_back({path, util::File::ReadAll(path)});
  }
  return request;
}

void PrintResult(const ExecutionResult& result, const std::string& image_path,
                 std::ostream* out) {
  if (!result.logs.empty()) *out << result.logs << std::endl;
  KJ_IF_MAYBE(image, result.image) {
    if (image_path.empty()) {
      *out << kImageTag << *image << std::endl;
    } else {
      util::File::WriteAll(image_path, *image, true);
      KJ_LOG(INFO, "Image written", image_path, image->size());
    }
  }
}

}  // namespace runner
