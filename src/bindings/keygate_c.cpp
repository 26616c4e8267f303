#include "keygate/keygate_c.h"
#include "../protocol/calendar.hpp"
#include "../protocol/keyderiver.hpp"
#include "../protocol/keyvalidator.hpp"
#include "../protocol/gateconfig.hpp"
#include "../helpers.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace protocol;
using keyvalidator::AccessTier;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct keygate_config_t {
    GateConfig config;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static CalendarDate to_calendar_date(const keygate_date_t* date) {
    return make_date(date->year, date->month, date->day);
}

static void from_calendar_date(const CalendarDate& d, keygate_date_t* out) {
    out->year = d.year;
    out->month = d.month;
    out->day = d.day;
}

static int tier_to_c(AccessTier tier) {
    switch (tier) {
        case AccessTier::Standard: return KEYGATE_TIER_STANDARD;
        case AccessTier::Elevated: return KEYGATE_TIER_ELEVATED;
        case AccessTier::Rejected: return KEYGATE_TIER_REJECTED;
    }
    return KEYGATE_TIER_REJECTED;
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int keygate_init(void) {
    try {
        keygate::utils::ensure_sodium_init();
        return KEYGATE_OK;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

void keygate_free_string(char* str) {
    delete[] str;
}

void keygate_free_strings(char** strs, size_t count) {
    if (!strs) return;
    for (size_t i = 0; i < count; ++i) {
        keygate_free_string(strs[i]);
        strs[i] = nullptr;
    }
}

const char* keygate_tier_name(int tier) {
    switch (tier) {
        case KEYGATE_TIER_REJECTED: return "rejected";
        case KEYGATE_TIER_STANDARD: return "standard";
        case KEYGATE_TIER_ELEVATED: return "elevated";
        default: return nullptr;
    }
}

/*==============================================================================
 * Date API
 *============================================================================*/

int keygate_today(keygate_date_t* out) {
    if (!out) return KEYGATE_ERR_INVALID_ARG;

    try {
        from_calendar_date(local_today(), out);
        return KEYGATE_OK;
    } catch (const CalendarError&) {
        return KEYGATE_ERR_INVALID_DATE;
    }
}

int keygate_parse_date(const char* text, keygate_date_t* out) {
    if (!text || !out) return KEYGATE_ERR_INVALID_ARG;

    try {
        from_calendar_date(parse_date(std::string(text)), out);
        return KEYGATE_OK;
    } catch (const CalendarError&) {
        return KEYGATE_ERR_INVALID_DATE;
    }
}

/*==============================================================================
 * Derivation API
 *============================================================================*/

int keygate_derive(const keygate_date_t* date, int mode, char** out, size_t* out_count) {
    if (!date || !out || !out_count) return KEYGATE_ERR_INVALID_ARG;

    try {
        keyderiver::Derived derived = keyderiver::derive(to_calendar_date(date),
                                                         keyderiver::mode_from_int(mode));
        std::vector<std::string> strings;
        if (auto* digests = std::get_if<keyderiver::DigestSet>(&derived)) {
            strings = *digests;
        } else {
            strings.push_back(std::get<keyderiver::SharedDigest>(derived));
        }

        // Copy everything before handing ownership to the caller
        std::vector<std::unique_ptr<char[]>> copies;
        copies.reserve(strings.size());
        for (const auto& s : strings) {
            copies.emplace_back(copy_to_c_string(s));
        }
        for (size_t i = 0; i < copies.size(); ++i) {
            out[i] = copies[i].release();
        }
        *out_count = copies.size();
        return KEYGATE_OK;
    } catch (const keyderiver::InvalidModeError&) {
        return KEYGATE_ERR_INVALID_MODE;
    } catch (const CalendarError&) {
        return KEYGATE_ERR_INVALID_DATE;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

int keygate_derive_normal(const keygate_date_t* date, char** out) {
    size_t count = 0;
    return keygate_derive(date, KEYGATE_MODE_NORMAL, out, &count);
}

int keygate_derive_shared(const keygate_date_t* date, char** out) {
    size_t count = 0;
    return keygate_derive(date, KEYGATE_MODE_SHARED, out, &count);
}

/*==============================================================================
 * Validation API
 *============================================================================*/

int keygate_validate(const keygate_date_t* date, const char* candidate, int* tier_out) {
    if (!date || !candidate || !tier_out) return KEYGATE_ERR_INVALID_ARG;

    try {
        *tier_out = tier_to_c(keyvalidator::validate(std::string(candidate), to_calendar_date(date)));
        return KEYGATE_OK;
    } catch (const CalendarError&) {
        return KEYGATE_ERR_INVALID_DATE;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

int keygate_validate_today(const char* candidate, int* tier_out) {
    if (!candidate || !tier_out) return KEYGATE_ERR_INVALID_ARG;

    try {
        keyvalidator::KeyValidator validator;
        *tier_out = tier_to_c(validator.validate(std::string(candidate)));
        return KEYGATE_OK;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

/*==============================================================================
 * Config API
 *============================================================================*/

int keygate_config_from_env_string(const char* env_content, keygate_config_t** out) {
    if (!env_content || !out) return KEYGATE_ERR_INVALID_ARG;

    try {
        auto cfg = std::make_unique<keygate_config_t>();
        cfg->config = GateConfig::from_env_string(std::string(env_content));
        *out = cfg.release();
        return KEYGATE_OK;
    } catch (const ConfigError&) {
        return KEYGATE_ERR_PARSE;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

int keygate_config_to_env_string(const keygate_config_t* cfg, char** out) {
    if (!cfg || !out) return KEYGATE_ERR_INVALID_ARG;

    try {
        *out = copy_to_c_string(cfg->config.to_env_string());
        return KEYGATE_OK;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

void keygate_config_destroy(keygate_config_t* cfg) {
    delete cfg;
}

int keygate_config_model_for_tier(const keygate_config_t* cfg, int tier, char** out) {
    if (!cfg || !out) return KEYGATE_ERR_INVALID_ARG;

    AccessTier t;
    switch (tier) {
        case KEYGATE_TIER_STANDARD: t = AccessTier::Standard; break;
        case KEYGATE_TIER_ELEVATED: t = AccessTier::Elevated; break;
        default: return KEYGATE_ERR_INVALID_ARG;
    }

    try {
        auto model = model_for_tier(cfg->config, t);
        if (!model) return KEYGATE_ERR_INVALID_ARG;
        *out = copy_to_c_string(*model);
        return KEYGATE_OK;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}

int keygate_config_validate(const keygate_config_t* cfg, const char* candidate, int* tier_out) {
    if (!cfg || !candidate || !tier_out) return KEYGATE_ERR_INVALID_ARG;

    try {
        keyvalidator::KeyValidator validator(cfg->config.date_source());
        *tier_out = tier_to_c(validator.validate(std::string(candidate)));
        return KEYGATE_OK;
    } catch (const CalendarError&) {
        return KEYGATE_ERR_INVALID_DATE;
    } catch (const std::exception&) {
        return KEYGATE_ERR;
    }
}
