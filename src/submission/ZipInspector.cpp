#include "submission/ZipInspector.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace hwcheck {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;

constexpr size_t kBlockSize = 16384;

std::string archive_error(archive* a, const std::string& fallback) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : fallback;
}

// reads the current entry's data; false on a read error
bool read_entry(archive* a, std::string& out) {
    out.clear();
    char buffer[kBlockSize];
    while (true) {
        const la_ssize_t n = archive_read_data(a, buffer, sizeof(buffer));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buffer, (size_t)n);
    }
}

} // namespace

ZipListing inspect_zip(const std::filesystem::path& zip_path, const std::string& index_name) {
    ZipListing listing;

    ArchiveReader reader(archive_read_new());
    if (!reader) {
        listing.error = "archive_read_new failed";
        return listing;
    }
    archive* a = reader.get();
    archive_read_support_format_zip(a);

    if (archive_read_open_filename(a, zip_path.string().c_str(), kBlockSize) != ARCHIVE_OK) {
        listing.error = archive_error(a, "failed to open " + zip_path.string());
        return listing;
    }

    while (true) {
        archive_entry* entry = nullptr;
        const int status = archive_read_next_header(a, &entry);
        if (status == ARCHIVE_EOF) break;
        if (status < ARCHIVE_WARN) {
            listing.error = archive_error(a, "failed to read zip header");
            listing.members.clear();
            listing.index_present = false;
            listing.index_read_ok = false;
            listing.index_bytes.clear();
            return listing;
        }

        const char* name = archive_entry_pathname(entry);
        const std::string member = name ? name : "";
        listing.members.push_back(member);

        if (member == index_name && !listing.index_present) {
            listing.index_present = true;
            listing.index_read_ok = read_entry(a, listing.index_bytes);
            if (!listing.index_read_ok) listing.index_bytes.clear();
        }
    }

    listing.opened = true;
    return listing;
}

} // namespace hwcheck
