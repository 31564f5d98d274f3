#include <magic.h>
#include <memory>
#include <type_traits>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace {

using MagicHandle = std::unique_ptr<std::remove_pointer_t<magic_t>, decltype(&magic_close)>;

// one cookie per thread; magic_t is not safe to share between threads
const MagicHandle& thread_cookie() {
    thread_local MagicHandle cookie = [] {
        MagicHandle h(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR), &magic_close);
        if (!h) {
            docmill::Logger::log(docmill::LogLevel::Warning, "magic_open failed", "libmagic");
        } else if (magic_load(h.get(), nullptr) != 0) {
            const char* err = magic_error(h.get());
            docmill::Logger::log(docmill::LogLevel::Warning,
                                 std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
            h.reset();
        }
        return h;
    }();
    return cookie;
}

} // namespace

std::string docmill::MimeDetector::detect(const std::filesystem::path& path)
{
    const MagicHandle& cookie = thread_cookie();
    if (!cookie) {
        return {};
    }
    const char* mime = magic_file(cookie.get(), path.string().c_str());
    if (!mime) {
        Logger::log(LogLevel::Debug, "magic_file failed for " + path.string(), "libmagic");
        return {};
    }
    return mime;
}
