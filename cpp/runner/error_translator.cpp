#include "runner/error_translator.hpp"

#include <vector>

namespace runner {

namespace {
struct ErrorCategory {
  std::vector<const char*> markers;
  const char* prefix;
  const char* hint;
};

const std::vector<ErrorCategory>& Categories() {
  static const std::vector<ErrorCategory> categories = {
      {{"ImportError", "ModuleNotFoundError"},
       "\xF0\x9F\x9A\xAB Import blocked: ",
       "Only `import cv2` and `import numpy as np` are allowed."},
      {{"SyntaxError"}, "\xE2\x9C\x8F\xEF\xB8\x8F Syntax error in your code: ",
       nullptr},
      {{"NameError"},
       "\xE2\x9D\x93 Name not found: ",
       "Did you define this variable?"},
      {{"TypeError"}, "\xF0\x9F\x94\xA7 Type error: ", nullptr},
      {{"AttributeError"},
       "\xF0\x9F\x94\x8D Attribute error: ",
       "Check the OpenCV function name."},
  };
  return categories;
}

const constexpr char* kGenericPrefix = "\xE2\x9D\x8C Error: ";
}  // namespace

std::string TranslateError(const std::string& raw) {
  for (const ErrorCategory& category : Categories()) {
    for (const char* marker : category.markers) {
      if (raw.find(marker) == std::string::npos) continue;
      std::string message = category.prefix + raw;
      if (category.hint) {
        message += '\n';
        message += category.hint;
      }
      return message;
    }
  }
  return kGenericPrefix + raw;
}

}  // namespace runner
