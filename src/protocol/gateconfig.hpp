#ifndef KEYGATE_PROTOCOL_GATECONFIG_HPP
#define KEYGATE_PROTOCOL_GATECONFIG_HPP

#include "calendar.hpp"
#include "keyvalidator.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace protocol {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// GateConfig - tier to model policy used by the front end
// -----------------------------------------------------------------------------
struct GateConfig {
    std::string standard_model = "gpt-3.5-turbo";
    std::string elevated_model = "gpt-4o-mini";

    // Pins "today" for validation; the host local date is used when unset.
    std::optional<CalendarDate> date_override;

    // Serialize to environment variable format
    std::string to_env_string() const;

    // Deserialize from environment variable format. Keys that are not
    // present keep their defaults.
    static GateConfig from_env_string(const std::string& env_content);

    DateSource date_source() const;
};

// Model selected for a tier; empty for Rejected.
std::optional<std::string> model_for_tier(const GateConfig& config, keyvalidator::AccessTier tier);

} // namespace protocol

#endif // KEYGATE_PROTOCOL_GATECONFIG_HPP
