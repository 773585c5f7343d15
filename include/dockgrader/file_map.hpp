#pragma once

#include <map>
#include <string>

namespace dockgrader {

/// Submitted files: relative path (with '/' separators) -> file contents
using FileMap = std::map<std::string, std::string>;

} // namespace dockgrader
