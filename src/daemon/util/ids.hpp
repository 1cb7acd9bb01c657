#pragma once

#include <string>

namespace ids {

// Random RFC 4122 version-4 identifier, used for uploads, jobs and worker owners.
std::string generate();

} // namespace ids
