#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cmdtrust::exec {

// tool substring -> flag that makes the tool inert or read-only.
// Order matters: the first tool found in the command wins.
const std::vector<std::pair<std::string, std::string>>& dry_run_mappings();

// Adds the dry-run flag for the first known tool in `command`. A command
// that already carries the flag, or mentions no known tool, is returned
// unchanged.
std::string add_dry_run_flags(const std::string& command);

}  // namespace cmdtrust::exec
