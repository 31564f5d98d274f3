/**
 * @file ooxml_archive.hpp
 * @brief In-memory reader for the XML parts of Office Open XML packages.
 */

#ifndef DOCMILL_OOXML_ARCHIVE_HPP
#define DOCMILL_OOXML_ARCHIVE_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace docmill {

/**
 * @brief The parts of an OOXML (ZIP) package loaded into memory.
 *
 * @details Uses libarchive to walk the package once and keep the entries
 * accepted by a filter. Entry names are stored exactly as they appear in the
 * ZIP central directory (e.g. "word/document.xml").
 */
class OoxmlArchive {
public:
    using EntryFilter = std::function<bool(std::string_view name)>;

    /**
     * @brief Reads the entries of `path` accepted by `filter`.
     * @throws std::runtime_error if the file is not a readable ZIP package.
     */
    static OoxmlArchive open(const std::filesystem::path& path, const EntryFilter& filter);

    /// @return The entry's bytes, or std::nullopt if the package has no such entry.
    [[nodiscard]] std::optional<std::string_view> entry(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return entries_.contains(name); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace docmill

#endif // DOCMILL_OOXML_ARCHIVE_HPP
