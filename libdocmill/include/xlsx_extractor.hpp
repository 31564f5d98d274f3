/**
 * @file xlsx_extractor.hpp
 * @brief Defines the IExtractor implementation for spreadsheets.
 */

#ifndef DOCMILL_XLSX_EXTRACTOR_HPP
#define DOCMILL_XLSX_EXTRACTOR_HPP

#include "extractor.hpp"
#include <array>
#include <string_view>
#include <span>

namespace docmill {

/**
 * @brief Extracts cell values from SpreadsheetML (.xlsx) workbooks.
 *
 * @details Sheets are listed in workbook order (`xl/workbook.xml`) and
 * located through `xl/_rels/workbook.xml.rels`. Shared strings, inline
 * strings, formula string results, booleans and numeric values are read.
 * Each sheet is rendered as `[SHEET: name]` followed by one line per row with
 * its non-empty cell values joined by ` | `. Sheets without values are
 * omitted; sheets are separated by a blank line.
 *
 * Legacy binary .xls files share the Spreadsheet format but have no reader.
 */
class XlsxExtractor final : public IExtractor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "XLSX";
    }

    [[nodiscard]] DocumentFormat get_format() const noexcept override {
        return DocumentFormat::Spreadsheet;
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 1> kMimes = {
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"
        };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".xlsx" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] ExtractionResult extract(const std::filesystem::path& path) const noexcept override;
};

} // namespace docmill

#endif // DOCMILL_XLSX_EXTRACTOR_HPP
