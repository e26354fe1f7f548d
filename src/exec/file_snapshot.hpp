#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>

namespace cmdtrust::exec {

// Set of "relative/path:mtime" keys for every regular file under a root,
// skipping anything inside a dot-prefixed directory or named with a leading
// dot. A read-only scan; takes no locks.
class FileSnapshot {
public:
    static FileSnapshot capture(const std::filesystem::path& root);

    // Number of keys present in exactly one of the two snapshots.
    std::size_t symmetric_difference(const FileSnapshot& other) const;

    std::size_t size() const { return entries_.size(); }

private:
    std::set<std::string> entries_;
};

}  // namespace cmdtrust::exec
