#ifndef DOCMILL_ERRORS_HPP
#define DOCMILL_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docmill {

/**
 * @brief Raised by ExtractorRegistry::resolve() for an extension outside the capability table.
 */
class UnsupportedFormatError : public std::runtime_error {
public:
    UnsupportedFormatError(const std::string& extension, std::vector<std::string> supported)
        : std::runtime_error("Unsupported format: " + extension),
          extension_(extension), supported_(std::move(supported)) {}

    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }
    [[nodiscard]] const std::vector<std::string>& supported_formats() const noexcept { return supported_; }

private:
    std::string extension_;
    std::vector<std::string> supported_;
};

/**
 * @brief Raised by ExtractorRegistry::resolve() for a known format whose backend is unavailable.
 */
class DependencyMissingError : public std::runtime_error {
public:
    DependencyMissingError(const std::string& extension, std::string install_hint)
        : std::runtime_error("Format " + extension + " requires additional dependencies"),
          extension_(extension), install_hint_(std::move(install_hint)) {}

    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }
    [[nodiscard]] const std::string& install_hint() const noexcept { return install_hint_; }

private:
    std::string extension_;
    std::string install_hint_;
};

} // namespace docmill

#endif // DOCMILL_ERRORS_HPP
