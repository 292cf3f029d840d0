#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace hwcheck {

struct ZipListing {
    bool opened = false;               // false: missing file, not a zip, or listing failed part way
    std::string error;                 // libarchive message when !opened

    std::vector<std::string> members;  // archive order, directories included

    bool index_present = false;
    bool index_read_ok = false;
    std::string index_bytes;           // raw member content, undecoded
};

// Lists a ZIP archive and pulls out the bytes of one member (matched by exact name).
// Nothing is written to disk.
ZipListing inspect_zip(const std::filesystem::path& zip_path, const std::string& index_name);

} // namespace hwcheck
