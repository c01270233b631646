#include "runner/output_parser.hpp"

#include <cstring>

#include "runner/error_translator.hpp"

namespace runner {

namespace {
const constexpr char* kWhitespace = " \t\n\r\f\v";

bool StartsWith(const std::string& line, const char* prefix) {
  return line.compare(0, strlen(prefix), prefix) == 0;
}

std::string Remainder(const std::string& line, const char* prefix) {
  return line.substr(strlen(prefix));
}
}  // namespace

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) return lines;
  size_t end = text.find_last_not_of(kWhitespace) + 1;
  // Lines end with \n, \r\n or a lone \r.
  while (begin <= end) {
    size_t line_end = text.find_first_of("\r\n", begin);
    if (line_end == std::string::npos || line_end > end) line_end = end;
    lines.push_back(text.substr(begin, line_end - begin));
    begin = line_end + 1;
    if (line_end < end && text[line_end] == '\r' && text[begin] == '\n') {
      begin++;
    }
  }
  return lines;
}

ExecutionResult ParseOutput(const std::string& stdout_text,
                            const std::string& stderr_text) {
  ExecutionResult result;
  std::vector<std::string> logs;
  for (const std::string& line : SplitLines(stdout_text)) {
    if (StartsWith(line, kImageTag)) {
      result.image = Remainder(line, kImageTag);
    } else if (StartsWith(line, kInfoTag)) {
      logs.push_back(Remainder(line, kInfoTag));
    } else {
      logs.push_back(line);
    }
  }
  for (const std::string& line : SplitLines(stderr_text)) {
    if (StartsWith(line, kErrorTag)) {
      result.error = TranslateError(Remainder(line, kErrorTag));
    } else {
      logs.push_back(line);
    }
  }
  // A failed run has no image, even if one was printed before the error.
  if (!result.error.empty()) result.image = nullptr;
  for (size_t i = 0; i < logs.size(); i++) {
    if (i) result.logs += '\n';
    result.logs += logs[i];
  }
  return result;
}

}  // namespace runner
