#include "runner/dispatcher.hpp"

#include <kj/debug.h>

namespace runner {

namespace {
const constexpr char* kLiveCaptureMarker = "cv2.VideoCapture";
}  // namespace

bool Dispatcher::NeedsForeground(const std::string& source_code) {
  return source_code.find(kLiveCaptureMarker) != std::string::npos;
}

ExecutionResult Dispatcher::Execute(const ExecutionRequest& request) {
  bool foreground = NeedsForeground(request.source_code);
  KJ_LOG(INFO, "Dispatching request", request.source_code.size(),
         request.assets.size(), request.run_foreground, foreground);
  if (foreground) return foreground_.Execute(request);
  return bounded_.Execute(request);
}

}  // namespace runner
