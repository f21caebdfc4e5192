/**
 * @file GameConfig.cpp
 * @brief Validated server settings
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/GameConfig.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>
#include <Ascent/Game/Protocol.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace Ascent::Game {

using Config::ConfigValue;

namespace {

using Setter = Result<void> (*)(GameConfig&, const ConfigValue&);

struct Field {
    const char* key;
    Setter apply;
};

std::string asString(const ConfigValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return Config::toString(value);
}

Result<int64_t> asInteger(const ConfigValue& value) {
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return *integer;
    }
    return ErrorCode::ConfigInvalid;
}

Result<double> asReal(const ConfigValue& value) {
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    return ErrorCode::ConfigInvalid;
}

/// Decimal with at most two places, in hundredths
Result<int64_t> asHundredths(const ConfigValue& value) {
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        constexpr int64_t kLimit = std::numeric_limits<int64_t>::max() / 100;
        if (*integer > kLimit || *integer < -kLimit) {
            return ErrorCode::ConfigInvalid;
        }
        return *integer * 100;
    }
    if (const auto* real = std::get_if<double>(&value)) {
        const double scaled = *real * 100.0;
        const double rounded = std::round(scaled);
        if (!std::isfinite(scaled) || std::fabs(rounded) > 9.0e15
            || std::fabs(scaled - rounded) > 1e-6) {
            return ErrorCode::ConfigInvalid;
        }
        return static_cast<int64_t>(rounded);
    }
    return ErrorCode::ConfigInvalid;
}

Result<uint16_t> asPort(const ConfigValue& value) {
    auto port = asInteger(value);
    if (port.isFailure() || port.value() < 0 || port.value() > 65535) {
        return ErrorCode::ConfigInvalid;
    }
    return static_cast<uint16_t>(port.value());
}

Result<size_t> asCount(const ConfigValue& value) {
    auto count = asInteger(value);
    if (count.isFailure() || count.value() <= 0) {
        return ErrorCode::ConfigInvalid;
    }
    return static_cast<size_t>(count.value());
}

Result<Milliseconds> asMillis(const ConfigValue& value) {
    auto millis = asInteger(value);
    if (millis.isFailure()) {
        return millis.error();
    }
    return Milliseconds(millis.value());
}

const std::array<Field, 17> FIELDS = {{
    {"client_seed", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        c.clientSeed = asString(v);
        return Result<void>::Success();
    }},
    {"edge_factor", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        double edge = 0.0;
        ASCENT_TRY_ASSIGN(edge, asReal(v));
        c.edgeFactor = edge;
        return Result<void>::Success();
    }},
    {"waiting_seconds", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        int64_t seconds = 0;
        ASCENT_TRY_ASSIGN(seconds, asInteger(v));
        c.waitingSeconds = seconds;
        return Result<void>::Success();
    }},
    {"countdown_interval_ms", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        Milliseconds interval{0};
        ASCENT_TRY_ASSIGN(interval, asMillis(v));
        c.countdownInterval = interval;
        return Result<void>::Success();
    }},
    {"tick_interval_ms", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        Milliseconds interval{0};
        ASCENT_TRY_ASSIGN(interval, asMillis(v));
        c.tickInterval = interval;
        return Result<void>::Success();
    }},
    {"multiplier_step", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        int64_t step = 0;
        ASCENT_TRY_ASSIGN(step, asHundredths(v));
        c.multiplierStep = step;
        return Result<void>::Success();
    }},
    {"crash_pause_ms", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        Milliseconds pause{0};
        ASCENT_TRY_ASSIGN(pause, asMillis(v));
        c.crashPause = pause;
        return Result<void>::Success();
    }},
    {"starting_balance", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        int64_t balance = 0;
        ASCENT_TRY_ASSIGN(balance, asHundredths(v));
        c.startingBalance = balance;
        return Result<void>::Success();
    }},
    {"max_bet", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        int64_t limit = 0;
        ASCENT_TRY_ASSIGN(limit, asHundredths(v));
        c.maxBet = limit;
        return Result<void>::Success();
    }},
    {"bind_address", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        c.bindAddress = asString(v);
        return Result<void>::Success();
    }},
    {"port", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        uint16_t port = 0;
        ASCENT_TRY_ASSIGN(port, asPort(v));
        c.port = port;
        return Result<void>::Success();
    }},
    {"admin_port", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        uint16_t port = 0;
        ASCENT_TRY_ASSIGN(port, asPort(v));
        c.adminPort = port;
        return Result<void>::Success();
    }},
    {"session_queue_depth", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        size_t depth = 0;
        ASCENT_TRY_ASSIGN(depth, asCount(v));
        c.sessionQueueDepth = depth;
        return Result<void>::Success();
    }},
    {"persistence_queue_depth", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        size_t depth = 0;
        ASCENT_TRY_ASSIGN(depth, asCount(v));
        c.persistenceQueueDepth = depth;
        return Result<void>::Success();
    }},
    {"persistence_path", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        c.persistencePath = asString(v);
        return Result<void>::Success();
    }},
    {"log_level", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        if (!Core::ParseLogLevel(asString(v), c.logLevel)) {
            return ErrorCode::ConfigInvalid;
        }
        return Result<void>::Success();
    }},
    {"log_file", [](GameConfig& c, const ConfigValue& v) -> Result<void> {
        c.logFile = asString(v);
        return Result<void>::Success();
    }},
}};

const Field* findField(const std::string& key) {
    auto it = std::find_if(FIELDS.begin(), FIELDS.end(),
                           [&key](const Field& field) { return key == field.key; });
    return it == FIELDS.end() ? nullptr : &*it;
}

Result<void> applyField(GameConfig& config, const Field& field, const ConfigValue& value,
                        const char* origin) {
    auto result = field.apply(config, value);
    if (result.isFailure()) {
        ASCENT_LOG_ERROR_F("Invalid value '%s' for %s (%s)",
                           Config::toString(value).c_str(), field.key, origin);
    }
    return result;
}

std::string environmentName(const char* key) {
    std::string name = "ASCENT_";
    for (const char* p = key; *p != '\0'; ++p) {
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*p))));
    }
    return name;
}

} // namespace

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<void> GameConfig::validate() const {
    auto reject = [](const char* reason) -> Result<void> {
        ASCENT_LOG_ERROR_F("Invalid configuration: %s", reason);
        return ErrorCode::ConfigInvalid;
    };

    // Published in every ROUND_START frame
    if (!isValidUtf8(clientSeed)) {
        return reject("client_seed must be valid UTF-8");
    }
    if (!FairnessCommitment::isValidEdgeFactor(edgeFactor)) {
        return reject("edge_factor must be in (0, 1]");
    }
    if (waitingSeconds < 1) {
        return reject("waiting_seconds must be at least 1");
    }
    if (countdownInterval.count() <= 0) {
        return reject("countdown_interval_ms must be positive");
    }
    if (tickInterval.count() <= 0) {
        return reject("tick_interval_ms must be positive");
    }
    if (multiplierStep <= 0) {
        return reject("multiplier_step must be positive");
    }
    if (crashPause.count() < 0) {
        return reject("crash_pause_ms must not be negative");
    }
    if (startingBalance < 0) {
        return reject("starting_balance must not be negative");
    }
    if (maxBet < 0) {
        return reject("max_bet must not be negative");
    }
    if (port == 0) {
        return reject("port must be set");
    }
    if (adminPort != 0 && adminPort == port) {
        return reject("admin_port must differ from port");
    }
    if (sessionQueueDepth == 0 || persistenceQueueDepth == 0) {
        return reject("queue depths must be positive");
    }

    return Result<void>::Success();
}

Result<GameConfig> GameConfig::fromMap(const Config::ConfigMap& values,
                                       const EnvironmentLookup& environment) {
    GameConfig config;

    for (const auto& [key, value] : values) {
        const Field* field = findField(key);
        if (field == nullptr) {
            ASCENT_LOG_WARNING_F("Ignoring unknown configuration key '%s'", key.c_str());
            continue;
        }
        ASCENT_TRY(applyField(config, *field, value, "file"));
    }

    if (environment) {
        if (auto port = environment("PORT")) {
            ASCENT_TRY(applyField(config, *findField("port"), Config::inferValue(*port), "PORT"));
        }

        for (const auto& field : FIELDS) {
            const std::string name = environmentName(field.key);
            if (auto text = environment(name)) {
                ASCENT_TRY(applyField(config, field, Config::inferValue(*text), name.c_str()));
            }
        }
    }

    ASCENT_TRY(config.validate());
    return config;
}

Result<GameConfig> GameConfig::load(const std::string& path,
                                    const EnvironmentLookup& environment) {
    Config::ConfigMap values;

    if (!path.empty()) {
        Config::ConfigLoader loader;
        auto loaded = loader.load(path);
        if (loaded.isFailure()) {
            ASCENT_LOG_ERROR_F("Cannot read configuration %s: %s", path.c_str(),
                               std::string(getErrorMessage(loaded.error())).c_str());
            return loaded.error();
        }
        values = std::move(loaded).value();
    }

    return fromMap(values, environment);
}

} // namespace Ascent::Game
