#include "../../include/pdf_info.hpp"
#include "../../include/logger.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <ostream>
#include <sstream>

namespace docmill {

namespace {

// helper: custom streambuf to redirect qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        if (!s.empty()) {
            Logger::log(level, s, module);
            str("");
        }
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

std::string info_string(QPDFObjectHandle info, const char* key) {
    if (!info.isDictionary() || !info.hasKey(key)) {
        return {};
    }
    QPDFObjectHandle value = info.getKey(key);
    return value.isString() ? value.getUTF8Value() : std::string{};
}

} // namespace

std::optional<PdfInfo> read_pdf_info(const std::filesystem::path& path) noexcept {
    LoggerStreamBuf warn_buf(LogLevel::Debug, "qpdf");
    LoggerStreamBuf err_buf(LogLevel::Debug, "qpdf");
    std::ostream warn_os(&warn_buf);
    std::ostream err_os(&err_buf);

    try {
        QPDF pdf;
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&warn_os, &err_os);
        pdf.setLogger(qlogger);
        pdf.processFile(path.string().c_str());

        PdfInfo info;
        info.page_count = pdf.getAllPages().size();
        info.encrypted = pdf.isEncrypted();

        QPDFObjectHandle trailer = pdf.getTrailer();
        if (trailer.hasKey("/Info")) {
            QPDFObjectHandle dict = trailer.getKey("/Info");
            info.title = info_string(dict, "/Title");
            info.author = info_string(dict, "/Author");
            info.producer = info_string(dict, "/Producer");
        }
        return info;
    } catch (const QPDFExc& e) {
        Logger::log(LogLevel::Warning, "qpdf cannot read " + path.filename().string() + ": " + e.what(), "pdf_info");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "PDF info failed for " + path.filename().string() + ": " + e.what(),
                    "pdf_info");
    }
    return std::nullopt;
}

} // namespace docmill
