/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Core/Config.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <cerrno>

#include <charconv>
#include <sstream>

namespace Ascent::Config {

namespace {

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

bool looksNumeric(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (i == text.size()) {
        return false;
    }
    bool digits = false;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c >= '0' && c <= '9') {
            digits = true;
        } else if (c != '.') {
            return false;
        }
    }
    return digits;
}

} // namespace

// ============================================================================
// Value inference
// ============================================================================

ConfigValue inferValue(std::string_view raw) {
    std::string text = trim(raw);

    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }

    if (text == "true") return true;
    if (text == "false") return false;

    if (looksNumeric(text)) {
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        if (*begin == '+') {
            ++begin;
        }

        if (text.find('.') == std::string::npos) {
            int64_t integer = 0;
            auto [ptr, ec] = std::from_chars(begin, end, integer);
            if (ec == std::errc() && ptr == end) {
                return integer;
            }
        } else {
            // strtod is locale-free for the "[-]digits.digits" shape accepted above
            char* parsedEnd = nullptr;
            std::string number(begin, end);
            double real = std::strtod(number.c_str(), &parsedEnd);
            if (parsedEnd == number.c_str() + number.size()) {
                return real;
            }
        }
    }

    return text;
}

std::string toString(const ConfigValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    return std::get<std::string>(value);
}

// ============================================================================
// ConfigLoader::Impl
// ============================================================================

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        const std::string& allowed = allowedResult.value();
        if (canonicalPath.length() <= allowed.length()) {
            return false;
        }

        return canonicalPath.compare(0, allowed.length(), allowed) == 0
            && canonicalPath[allowed.length()] == '/';
    }

    Result<std::string> readFile(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        // Open the canonical path without following a swapped-in symlink
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return ErrorCode::ConfigFileNotFound;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                close(fd);
                return ErrorCode::IOError;
            }
            if (n == 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::IOError;
        }

        return data;
    }

    Result<ConfigMap> parseConfig(std::string_view text) {
        ConfigMap config;

        std::istringstream stream{std::string(text)};
        std::string line;

        while (std::getline(stream, line)) {
            std::string trimmed = trim(line);

            if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
                continue;
            }

            size_t pos = trimmed.find('=');
            if (pos == std::string::npos) {
                return ErrorCode::ConfigParseFailed;
            }

            std::string key = trim(std::string_view(trimmed).substr(0, pos));
            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }

            config[key] = inferValue(std::string_view(trimmed).substr(pos + 1));
        }

        return config;
    }
};

// ============================================================================
// ConfigLoader - Public API
// ============================================================================

ConfigLoader::ConfigLoader()
    : ConfigLoader(Options{}) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(std::string_view text) {
    return m_impl->parseConfig(text);
}

} // namespace Ascent::Config
