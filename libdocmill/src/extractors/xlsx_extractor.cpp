#include "../../include/xlsx_extractor.hpp"
#include "../../include/logger.hpp"
#include "../../include/ooxml_archive.hpp"
#include "../../include/text_utils.hpp"

#include <pugixml.hpp>
#include <charconv>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace docmill {

namespace {

const char* extractor_tag() {
    return "xlsx_extractor";
}

// Cell formats (cellXfs index) whose number format renders a date or time.
struct CellStyles {
    std::vector<bool> date_xf;
    bool date1904 = false;

    [[nodiscard]] bool is_date(const std::size_t xf) const {
        return xf < date_xf.size() && date_xf[xf];
    }
};

struct SheetRef {
    std::string name;
    std::string part; ///< Package path of the worksheet part
};

pugi::xml_document parse_part(const std::string_view xml, const std::string& part) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        throw std::runtime_error("Failed to parse " + part + ": " + parsed.description());
    }
    return doc;
}

// Concatenated <t> text of a string item (<si> or <is>), including rich-text runs.
std::string string_item_text(const pugi::xml_node item) {
    if (const pugi::xml_node t = item.child("t")) {
        return t.child_value();
    }
    std::string text;
    for (const pugi::xml_node run : item.children("r")) {
        text += run.child("t").child_value();
    }
    return text;
}

std::vector<std::string> load_shared_strings(const OoxmlArchive& package) {
    std::vector<std::string> strings;
    const auto xml = package.entry("xl/sharedStrings.xml");
    if (!xml) return strings;

    const auto doc = parse_part(*xml, "xl/sharedStrings.xml");
    for (const pugi::xml_node si : doc.document_element().children("si")) {
        strings.push_back(string_item_text(si));
    }
    return strings;
}

// Relationship targets are relative to xl/ unless absolute within the package.
std::string resolve_target(const std::string& target) {
    if (!target.empty() && target.front() == '/') {
        return target.substr(1);
    }
    return "xl/" + target;
}

std::vector<SheetRef> list_sheets(const OoxmlArchive& package) {
    std::vector<SheetRef> sheets;
    const auto workbook_xml = package.entry("xl/workbook.xml");
    if (!workbook_xml) {
        throw std::runtime_error("Missing xl/workbook.xml");
    }

    std::map<std::string, std::string> rel_map;
    if (const auto rels_xml = package.entry("xl/_rels/workbook.xml.rels")) {
        const auto rels = parse_part(*rels_xml, "xl/_rels/workbook.xml.rels");
        for (const pugi::xml_node rel : rels.document_element().children("Relationship")) {
            const std::string id = rel.attribute("Id").as_string();
            const std::string target = rel.attribute("Target").as_string();
            if (!id.empty() && !target.empty()) {
                rel_map[id] = resolve_target(target);
            }
        }
    }

    const auto wb = parse_part(*workbook_xml, "xl/workbook.xml");
    for (const pugi::xml_node sheet : wb.document_element().child("sheets").children("sheet")) {
        const std::string name = sheet.attribute("name").as_string();
        const std::string rid = sheet.attribute("r:id").as_string();
        if (const auto it = rel_map.find(rid); it != rel_map.end()) {
            sheets.push_back({name, it->second});
        } else {
            Logger::log(LogLevel::Warning, "Sheet '" + name + "' has no relationship target", extractor_tag());
        }
    }
    return sheets;
}

bool is_builtin_date_format(const unsigned id) {
    return (id >= 14 && id <= 22) || (id >= 45 && id <= 47);
}

// A custom format is a date when a d/m/y/h/s token survives outside quoted
// literals, escaped characters and [..] sections.
bool is_date_format_code(const std::string_view code) {
    bool quoted = false;
    bool bracket = false;
    for (std::size_t i = 0; i < code.size(); ++i) {
        const char ch = code[i];
        if (quoted) {
            quoted = ch != '"';
            continue;
        }
        if (bracket) {
            bracket = ch != ']';
            continue;
        }
        switch (ch) {
            case '"': quoted = true; break;
            case '[': bracket = true; break;
            case '\\':
            case '_':
            case '*': ++i; break;
            case 'd': case 'D': case 'm': case 'M': case 'y': case 'Y':
            case 'h': case 'H': case 's': case 'S':
                return true;
            default: break;
        }
    }
    return false;
}

bool uses_1904_dates(const OoxmlArchive& package) {
    const auto xml = package.entry("xl/workbook.xml");
    if (!xml) return false;
    const auto wb = parse_part(*xml, "xl/workbook.xml");
    return wb.document_element().child("workbookPr").attribute("date1904").as_bool();
}

CellStyles load_cell_styles(const OoxmlArchive& package) {
    CellStyles styles;
    styles.date1904 = uses_1904_dates(package);
    const auto xml = package.entry("xl/styles.xml");
    if (!xml) return styles;

    const auto doc = parse_part(*xml, "xl/styles.xml");
    const pugi::xml_node root = doc.document_element();

    std::map<unsigned, bool> custom;
    for (const pugi::xml_node fmt : root.child("numFmts").children("numFmt")) {
        custom[fmt.attribute("numFmtId").as_uint()] = is_date_format_code(fmt.attribute("formatCode").as_string());
    }
    for (const pugi::xml_node xf : root.child("cellXfs").children("xf")) {
        const unsigned id = xf.attribute("numFmtId").as_uint();
        const auto it = custom.find(id);
        styles.date_xf.push_back(it != custom.end() ? it->second : is_builtin_date_format(id));
    }
    return styles;
}

// Serial day number to "YYYY-MM-DD HH:MM:SS", or "HH:MM:SS" for a pure time
// of day. Empty when the value is not a usable serial.
std::string format_serial_date(const std::string_view raw, const bool date1904) {
    const auto text = trim(raw);
    double serial = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), serial);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return {};
    if (!std::isfinite(serial) || serial < 0.0 || serial > 2958465.0) return {};

    auto days = static_cast<long>(std::floor(serial));
    auto seconds = static_cast<long>(std::llround((serial - static_cast<double>(days)) * 86400.0));
    if (seconds >= 86400) {
        ++days;
        seconds -= 86400;
    }

    std::ostringstream out;
    out << std::setfill('0');
    if (serial < 1.0 && days == 0) {
        out << std::setw(2) << seconds / 3600 << ':' << std::setw(2) << seconds / 60 % 60 << ':'
            << std::setw(2) << seconds % 60;
        return out.str();
    }

    using namespace std::chrono;
    // 1900 system: serials below 60 precede the phantom 1900-02-29
    const sys_days epoch = date1904 ? sys_days(year{1904} / January / 1)
                         : serial < 60.0 ? sys_days(year{1899} / December / 31)
                                         : sys_days(year{1899} / December / 30);
    const year_month_day ymd{epoch + std::chrono::days(days)};
    out << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day()) << ' '
        << std::setw(2) << seconds / 3600 << ':' << std::setw(2) << seconds / 60 % 60 << ':'
        << std::setw(2) << seconds % 60;
    return out.str();
}

std::string cell_value(const pugi::xml_node c, const std::vector<std::string>& shared,
                       const CellStyles& styles) {
    const std::string_view type = c.attribute("t").as_string();
    const pugi::xml_node v = c.child("v");

    if (type == "inlineStr") {
        return string_item_text(c.child("is"));
    }
    if (!v) {
        return {};
    }
    const std::string_view raw = v.child_value();
    if (type == "s") {
        std::size_t idx = 0;
        const auto trimmed = trim(raw);
        const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), idx);
        if (ec != std::errc{} || idx >= shared.size()) {
            Logger::log(LogLevel::Warning, "Invalid shared string index: " + std::string(raw), extractor_tag());
            return {};
        }
        return shared[idx];
    }
    if (type == "b") {
        return trim(raw) == "1" ? "TRUE" : "FALSE";
    }
    if ((type.empty() || type == "n") && styles.is_date(c.attribute("s").as_uint())) {
        if (std::string date = format_serial_date(raw, styles.date1904); !date.empty()) {
            return date;
        }
    }
    // "str", "e", "d" and other numeric cells carry their value verbatim
    return std::string(raw);
}

std::string render_sheet(const SheetRef& sheet, const std::string_view xml,
                         const std::vector<std::string>& shared, const CellStyles& styles) {
    const auto doc = parse_part(xml, sheet.part);
    std::string out = "[SHEET: " + sheet.name + "]";
    bool has_rows = false;

    for (const pugi::xml_node row : doc.document_element().child("sheetData").children("row")) {
        std::string line;
        for (const pugi::xml_node c : row.children("c")) {
            const std::string value = cell_value(c, shared, styles);
            const auto t = trim(value);
            if (t.empty()) continue;
            if (!line.empty()) line += " | ";
            line += t;
        }
        if (!line.empty()) {
            out += '\n';
            out += line;
            has_rows = true;
        }
    }
    return has_rows ? out : std::string{};
}

} // namespace

ExtractionResult XlsxExtractor::extract(const std::filesystem::path& path) const noexcept {
    ExtractionResult result;
    result.method = "ooxml";
    try {
        const auto package = OoxmlArchive::open(path, [](const std::string_view name) {
            return name.starts_with("xl/") && (name.ends_with(".xml") || name.ends_with(".rels"));
        });

        const auto shared = load_shared_strings(package);
        const auto sheets = list_sheets(package);
        const auto styles = load_cell_styles(package);

        std::string text;
        for (const auto& sheet : sheets) {
            const auto xml = package.entry(sheet.part);
            if (!xml) {
                Logger::log(LogLevel::Warning, "Missing worksheet part " + sheet.part, extractor_tag());
                continue;
            }
            const std::string rendered = render_sheet(sheet, *xml, shared, styles);
            if (rendered.empty()) continue;
            if (!text.empty()) text += "\n\n";
            text += rendered;
            ++result.units;
        }
        result.text = std::string(trim(text));
        Logger::log(LogLevel::Debug, path.filename().string() + ": " + std::to_string(result.units) + " of " +
                    std::to_string(sheets.size()) + " sheets with values", extractor_tag());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "XLSX extraction failed for " + path.string() + ": " + e.what(),
                    extractor_tag());
        result.text.clear();
        result.units = 0;
    }
    return result;
}

} // namespace docmill
