#include "../../include/text_extractor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

#include <iconv.h>
#include <cerrno>
#include <memory>
#include <vector>

namespace docmill {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

struct IconvCloser {
    void operator()(void* cd) const noexcept {
        iconv_close(static_cast<iconv_t>(cd));
    }
};

} // namespace

std::optional<std::string> TextExtractor::convert_to_utf8(std::string_view bytes, const char* from_encoding) {
    const iconv_t raw = iconv_open("UTF-8", from_encoding);
    if (raw == reinterpret_cast<iconv_t>(-1)) {
        Logger::log(LogLevel::Warning, std::string("iconv does not support ") + from_encoding, "text_extractor");
        return std::nullopt;
    }
    const std::unique_ptr<void, IconvCloser> cd(raw);

    std::string out;
    std::vector<char> buf(16 * 1024);
    auto* in_ptr = const_cast<char*>(bytes.data());
    size_t in_left = bytes.size();

    while (in_left > 0) {
        char* out_ptr = buf.data();
        size_t out_left = buf.size();
        const size_t rc = iconv(raw, &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buf.data(), buf.size() - out_left);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            }
            // EILSEQ / EINVAL: byte not defined in this encoding
            return std::nullopt;
        }
    }
    return out;
}

std::string TextExtractor::decode(std::string_view bytes, std::string* encoding_used) {
    if (bytes.starts_with(kUtf8Bom)) {
        bytes.remove_prefix(kUtf8Bom.size());
    }

    auto set_used = [encoding_used](const char* name) {
        if (encoding_used) *encoding_used = name;
    };

    if (is_valid_utf8(bytes)) {
        set_used("utf-8");
        return std::string(trim(bytes));
    }

    static constexpr std::array<const char*, 2> kFallbacks = { "CP1252", "ISO-8859-1" };
    for (const char* enc : kFallbacks) {
        if (auto converted = convert_to_utf8(bytes, enc)) {
            set_used(enc);
            return std::string(trim(*converted));
        }
    }

    Logger::log(LogLevel::Warning, "Text read with replacement characters, some characters may be lost",
                "text_extractor");
    set_used("utf-8 (lossy)");
    return std::string(trim(sanitize_utf8(bytes)));
}

ExtractionResult TextExtractor::extract(const std::filesystem::path& path) const noexcept {
    ExtractionResult result;
    result.method = "text";
    try {
        const auto bytes = read_file_bytes(path);
        if (!bytes) {
            Logger::log(LogLevel::Error, "Cannot read " + path.string(), "text_extractor");
            return result;
        }
        std::string encoding;
        result.text = decode(*bytes, &encoding);
        result.units = 1;
        Logger::log(LogLevel::Debug, path.filename().string() + " read as " + encoding, "text_extractor");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Text extraction failed for " + path.string() + ": " + e.what(),
                    "text_extractor");
        result.text.clear();
    }
    return result;
}

} // namespace docmill
