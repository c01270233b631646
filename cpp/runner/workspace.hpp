#ifndef RUNNER_WORKSPACE_HPP
#define RUNNER_WORKSPACE_HPP

#include <string>

#include "runner/request.hpp"

namespace runner {

// Returns the name under which an uploaded asset is written, that is the last
// component of its display name. Returns an empty string if the asset has to
// be dropped.
std::string SanitizeAssetName(const std::string& name);

// Writes the source code and the assets of the request inside dir, which must
// exist. Assets with the same sanitized name overwrite each other, the last
// one wins; an asset named like the source is dropped. Returns the absolute
// path of the source file.
std::string Materialize(const std::string& dir, const std::string& source_name,
                        const ExecutionRequest& request);

}  // namespace runner

#endif
