#ifndef KEYGATE_C_H
#define KEYGATE_C_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define KEYGATE_OK                 0
#define KEYGATE_ERR               -1
#define KEYGATE_ERR_INVALID_ARG   -2
#define KEYGATE_ERR_INVALID_MODE  -3
#define KEYGATE_ERR_INVALID_DATE  -4
#define KEYGATE_ERR_PARSE         -5

/*==============================================================================
 * Derivation modes
 *============================================================================*/
#define KEYGATE_MODE_NORMAL  0
#define KEYGATE_MODE_SHARED  1

/** Number of digests produced in normal mode. */
#define KEYGATE_NORMAL_KEY_COUNT 4

/*==============================================================================
 * Access tiers
 *============================================================================*/
#define KEYGATE_TIER_REJECTED  0
#define KEYGATE_TIER_STANDARD  1
#define KEYGATE_TIER_ELEVATED  2

/*==============================================================================
 * Types
 *============================================================================*/
typedef struct keygate_date_t {
    int year;
    int month;   /* 1..12 */
    int day;     /* 1..31 */
} keygate_date_t;

typedef struct keygate_config_t keygate_config_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int keygate_init(void);

/** Free a heap-allocated string returned by keygate_* functions. */
void keygate_free_string(char* str);

/** Free each of the `count` strings in `strs` (the array itself is caller-owned). */
void keygate_free_strings(char** strs, size_t count);

/** Static name of a tier ("standard", "elevated", "rejected"); NULL if unknown. */
const char* keygate_tier_name(int tier);

/*==============================================================================
 * Date API
 *============================================================================*/

/** Host local date. */
int keygate_today(keygate_date_t* out);

/** Parse a "YYYY-MM-DD" date. Returns KEYGATE_ERR_INVALID_DATE on failure. */
int keygate_parse_date(const char* text, keygate_date_t* out);

/*==============================================================================
 * Derivation API
 *============================================================================*/

/**
 * Derive the keys for a date.
 * @param date       Calendar date
 * @param mode       KEYGATE_MODE_NORMAL or KEYGATE_MODE_SHARED
 * @param out        Output: array with room for KEYGATE_NORMAL_KEY_COUNT strings
 * @param out_count  Output: number of strings written (4 normal, 1 shared)
 * Each string must be freed with keygate_free_string() or keygate_free_strings().
 * Returns KEYGATE_ERR_INVALID_MODE for any other mode value.
 */
int keygate_derive(const keygate_date_t* date, int mode, char** out, size_t* out_count);

/** Derive the four normal digests, in order. Free with keygate_free_strings(out, 4). */
int keygate_derive_normal(const keygate_date_t* date, char** out);

/** Derive the shared digest. Free with keygate_free_string(). */
int keygate_derive_shared(const keygate_date_t* date, char** out);

/*==============================================================================
 * Validation API
 *============================================================================*/

/**
 * Classify a candidate key for a date.
 * @param tier_out  Output: KEYGATE_TIER_*
 * Any candidate string is accepted; non-matching input yields KEYGATE_TIER_REJECTED.
 */
int keygate_validate(const keygate_date_t* date, const char* candidate, int* tier_out);

/** Classify a candidate key against the host local date. */
int keygate_validate_today(const char* candidate, int* tier_out);

/*==============================================================================
 * Config API
 *============================================================================*/

/**
 * Parse a gate config from environment variable format string.
 * Format: KEY=value lines (KEYGATE_STANDARD_MODEL, KEYGATE_ELEVATED_MODEL, KEYGATE_DATE).
 */
int keygate_config_from_env_string(const char* env_content, keygate_config_t** out);

/** Serialize a config. Caller must free with keygate_free_string(). */
int keygate_config_to_env_string(const keygate_config_t* cfg, char** out);

/** Free a config handle. */
void keygate_config_destroy(keygate_config_t* cfg);

/**
 * Model identifier for a tier. Caller must free with keygate_free_string().
 * Returns KEYGATE_ERR_INVALID_ARG for KEYGATE_TIER_REJECTED or an unknown tier.
 */
int keygate_config_model_for_tier(const keygate_config_t* cfg, int tier, char** out);

/**
 * Validate against the config's date source (KEYGATE_DATE if set, host local
 * date otherwise).
 */
int keygate_config_validate(const keygate_config_t* cfg, const char* candidate, int* tier_out);

#ifdef __cplusplus
}
#endif

#endif /* KEYGATE_C_H */
