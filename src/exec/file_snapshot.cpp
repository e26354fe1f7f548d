#include "exec/file_snapshot.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <vector>

namespace cmdtrust::exec {

namespace {

bool is_hidden(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

}  // namespace

FileSnapshot FileSnapshot::capture(const std::filesystem::path& root) {
    FileSnapshot snapshot;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return snapshot;
    }

    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto& entry = *it;
        if (is_hidden(entry.path())) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(ec) && !ec) {
            const auto mtime = std::filesystem::last_write_time(entry.path(), ec);
            if (!ec) {
                const auto relative = entry.path().lexically_relative(root);
                snapshot.entries_.insert(
                    relative.generic_string() + ":" +
                    std::to_string(mtime.time_since_epoch().count()));
            }
        }
        // A file vanishing mid-scan is not worth aborting the snapshot.
        ec.clear();
        it.increment(ec);
    }
    return snapshot;
}

std::size_t FileSnapshot::symmetric_difference(const FileSnapshot& other) const {
    std::vector<std::string> diff;
    std::set_symmetric_difference(entries_.begin(), entries_.end(),
                                  other.entries_.begin(), other.entries_.end(),
                                  std::back_inserter(diff));
    return diff.size();
}

}  // namespace cmdtrust::exec
