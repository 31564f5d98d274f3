#include "../../include/ooxml_archive.hpp"
#include "../../include/logger.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <memory>
#include <stdexcept>

namespace docmill {

namespace {

const char* archive_tag() {
    return "ooxml_archive";
}

struct ArchiveReadDeleter {
    void operator()(archive* a) const noexcept {
        archive_read_close(a);
        archive_read_free(a);
    }
};

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

} // namespace

OoxmlArchive OoxmlArchive::open(const std::filesystem::path& path, const EntryFilter& filter) {
    const std::unique_ptr<archive, ArchiveReadDeleter> in(archive_read_new());
    if (!in) {
        throw std::runtime_error("archive_read_new failed");
    }
    archive_read_support_format_zip(in.get());

    const int open_r = archive_read_open_filename(in.get(), path.string().c_str(), 10240);
    if (open_r != ARCHIVE_OK && open_r != ARCHIVE_WARN) {
        throw std::runtime_error("Failed to open OOXML package: " + error_of(in.get()));
    }
    if (open_r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(in.get()), archive_tag());
    }

    OoxmlArchive result;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK) {
        const char* ename = archive_entry_pathname(entry);
        if (!ename || archive_entry_filetype(entry) == AE_IFDIR || !filter(ename)) {
            archive_read_data_skip(in.get());
            continue;
        }

        std::string data;
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rb = archive_read_data_block(in.get(), &buff, &size, &offset);
            if (rb == ARCHIVE_EOF) break;
            if (rb != ARCHIVE_OK) {
                throw std::runtime_error(std::string("Error reading ") + ename + ": " + error_of(in.get()));
            }
            data.append(static_cast<const char*>(buff), size);
        }
        result.entries_.emplace(ename, std::move(data));
    }

    if (r != ARCHIVE_EOF) {
        throw std::runtime_error("Iteration error: " + error_of(in.get()));
    }

    Logger::log(LogLevel::Debug, "Loaded " + std::to_string(result.entries_.size()) + " parts from " +
                path.filename().string(), archive_tag());
    return result;
}

std::optional<std::string_view> OoxmlArchive::entry(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

} // namespace docmill
