#pragma once

#include <cstdint>
#include <filesystem>

namespace kiln {

// Pack a directory into a zip archive. Entries are sorted and timestamps zeroed, so equal
// trees produce byte-identical archives. Returns the number of regular files written.
std::uint64_t archive_zip_directory(std::filesystem::path const &directory,
                                    std::filesystem::path const &zip_path);

}  // namespace kiln
