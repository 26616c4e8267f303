#include "gateconfig.hpp"

#include <sstream>

namespace protocol {

namespace {

constexpr const char* KEY_STANDARD_MODEL = "KEYGATE_STANDARD_MODEL";
constexpr const char* KEY_ELEVATED_MODEL = "KEYGATE_ELEVATED_MODEL";
constexpr const char* KEY_DATE = "KEYGATE_DATE";

std::string trim(const std::string& s) {
    const char* ws = " \t\r";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string require_model(const std::string& key, const std::string& value) {
    if (value.empty()) {
        throw ConfigError(key + " must not be empty");
    }
    return value;
}

} // namespace

std::string GateConfig::to_env_string() const {
    std::ostringstream oss;
    oss << KEY_STANDARD_MODEL << "=" << standard_model << "\n";
    oss << KEY_ELEVATED_MODEL << "=" << elevated_model << "\n";
    if (date_override) {
        oss << KEY_DATE << "=" << to_string(*date_override) << "\n";
    }
    return oss.str();
}

GateConfig GateConfig::from_env_string(const std::string& env_content) {
    GateConfig cfg;
    std::istringstream in(env_content);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Line " + std::to_string(line_no) + ": expected KEY=value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == KEY_STANDARD_MODEL) {
            cfg.standard_model = require_model(key, value);
        } else if (key == KEY_ELEVATED_MODEL) {
            cfg.elevated_model = require_model(key, value);
        } else if (key == KEY_DATE) {
            try {
                cfg.date_override = parse_date(value);
            } catch (const CalendarError& e) {
                throw ConfigError("Line " + std::to_string(line_no) + ": " + e.what());
            }
        }
        // Unknown keys are ignored so one env file can serve several tools.
    }
    return cfg;
}

DateSource GateConfig::date_source() const {
    if (date_override) {
        CalendarDate pinned = *date_override;
        return [pinned]() { return pinned; };
    }
    return local_today;
}

std::optional<std::string> model_for_tier(const GateConfig& config, keyvalidator::AccessTier tier) {
    switch (tier) {
        case keyvalidator::AccessTier::Standard:
            return config.standard_model;
        case keyvalidator::AccessTier::Elevated:
            return config.elevated_model;
        case keyvalidator::AccessTier::Rejected:
            break;
    }
    return std::nullopt;
}

} // namespace protocol
