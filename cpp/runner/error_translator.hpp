#ifndef RUNNER_ERROR_TRANSLATOR_HPP
#define RUNNER_ERROR_TRANSLATOR_HPP

#include <string>

namespace runner {

// Rewrites the error reported by the wrapper into a message aimed at learners.
// The first matching category is applied, the raw message is always echoed.
std::string TranslateError(const std::string& raw);

}  // namespace runner

#endif
