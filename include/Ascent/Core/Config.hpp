/**
 * @file Config.hpp
 * @brief Configuration file loading for the Ascent round server
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Reads `key = value` files with protection against:
 * - Symlink substitution (O_NOFOLLOW on the canonical path)
 * - Oversized files (size checked on the open descriptor)
 * - Reading outside an allowed directory
 *
 * Values are typed on load: `true`/`false` become bool, integer literals
 * int64_t, decimal literals double, everything else string. Surrounding
 * double quotes force a string.
 */

#pragma once

#ifndef ASCENT_CORE_CONFIG_HPP
#define ASCENT_CORE_CONFIG_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace Ascent::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Infer the typed value of a raw configuration string
 */
ConfigValue inferValue(std::string_view raw);

/**
 * @brief Render a value back to text (used by diagnostics)
 */
std::string toString(const ConfigValue& value);

/**
 * @brief Configuration loader
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 64 * 1024;    // 64KB default
        std::string allowed_directory;       // Restrict to directory, empty = anywhere
    };

    explicit ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration, or ConfigFileNotFound, FileTooLarge,
     *         AccessDenied, InvalidPath, IOError, ConfigParseFailed
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration text
     *
     * Lines starting with `#` or `;` are comments. A non-blank line with no
     * `=` or an empty key fails with ConfigParseFailed.
     */
    Result<ConfigMap> loadFromMemory(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Ascent::Config

#endif // ASCENT_CORE_CONFIG_HPP
