#include <catch2/catch_test_macros.hpp>
#include "protocol/keyvalidator.hpp"
#include "protocol/keyderiver.hpp"
#include "test_helpers.hpp"

#include <cctype>
#include <string>

using namespace protocol;
using namespace protocol::keyvalidator;
using namespace test_helpers;

TEST_CASE("KeyValidator tiers", "[protocol][keyvalidator]") {
    init_crypto();
    const CalendarDate date = make_date(2024, 3, 15);
    const GoldenVector g = golden_2024_03_15();

    SECTION("each normal digest grants Standard") {
        for (const auto& key : keyderiver::derive_normal(date)) {
            REQUIRE(validate(key, date) == AccessTier::Standard);
        }
    }

    SECTION("the shared digest grants Elevated") {
        REQUIRE(validate(keyderiver::derive_shared(date), date) == AccessTier::Elevated);
        REQUIRE(validate(g.shared, date) == AccessTier::Elevated);
    }

    SECTION("pinned keys are accepted") {
        REQUIRE(validate(g.digests[0], date) == AccessTier::Standard);
        REQUIRE(validate(g.digests[3], date) == AccessTier::Standard);
    }

    SECTION("anything else is Rejected") {
        REQUIRE(validate("", date) == AccessTier::Rejected);
        REQUIRE(validate("not-a-real-key", date) == AccessTier::Rejected);
        REQUIRE(validate(std::string(64, '0'), date) == AccessTier::Rejected);
        REQUIRE(validate("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", date) ==
                AccessTier::Rejected);
    }

    SECTION("matching is exact") {
        std::string upper = g.digests[0];
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        REQUIRE(validate(upper, date) == AccessTier::Rejected);
        REQUIRE(validate(" " + g.digests[0], date) == AccessTier::Rejected);
        REQUIRE(validate(g.digests[0] + "\n", date) == AccessTier::Rejected);
        REQUIRE(validate(g.digests[0].substr(0, 63), date) == AccessTier::Rejected);
    }

    SECTION("raw key values are not keys") {
        REQUIRE(validate(g.key0_raw, date) == AccessTier::Rejected);
    }

    SECTION("keys from other days are Rejected") {
        CalendarDate tomorrow = next_day(date);
        for (const auto& key : keyderiver::derive_normal(tomorrow)) {
            REQUIRE(validate(key, date) == AccessTier::Rejected);
        }
        REQUIRE(validate(keyderiver::derive_shared(tomorrow), date) == AccessTier::Rejected);
    }

    SECTION("a date without keys rejects everything") {
        const CalendarDate keyless = make_date(1, 12, 1);
        REQUIRE(validate("", keyless) == AccessTier::Rejected);
        REQUIRE(validate(g.shared, keyless) == AccessTier::Rejected);
        REQUIRE(KeyValidator(fixed_date(keyless)).validate(g.digests[0]) == AccessTier::Rejected);
    }

    SECTION("tier names") {
        REQUIRE(tier_name(AccessTier::Standard) == "standard");
        REQUIRE(tier_name(AccessTier::Elevated) == "elevated");
        REQUIRE(tier_name(AccessTier::Rejected) == "rejected");
    }
}

TEST_CASE("KeyValidator date source", "[protocol][keyvalidator]") {
    init_crypto();

    SECTION("uses the injected date") {
        const GoldenVector g = golden_2025_01_01();
        KeyValidator validator(fixed_date(g.date));

        REQUIRE(validator.validate(g.digests[1]) == AccessTier::Standard);
        REQUIRE(validator.validate(g.shared) == AccessTier::Elevated);
        REQUIRE(validator.validate("not-a-real-key") == AccessTier::Rejected);
    }

    SECTION("re-reads the date on every call") {
        CalendarDate current = make_date(2024, 3, 15);
        KeyValidator validator([&current]() { return current; });

        const std::string key = keyderiver::derive_normal(current)[2];
        REQUIRE(validator.validate(key) == AccessTier::Standard);

        current = next_day(current);  // midnight passes
        REQUIRE(validator.validate(key) == AccessTier::Rejected);
        REQUIRE(validator.validate(keyderiver::derive_normal(current)[2]) == AccessTier::Standard);
    }

    SECTION("default source is the host local date") {
        KeyValidator validator;
        const std::string shared = keyderiver::derive_shared(local_today());
        // Guard against the test straddling midnight.
        AccessTier tier = validator.validate(shared);
        if (tier != AccessTier::Elevated) {
            tier = validator.validate(keyderiver::derive_shared(local_today()));
        }
        REQUIRE(tier == AccessTier::Elevated);
    }

    SECTION("an empty date source is refused") {
        REQUIRE_THROWS_AS(KeyValidator(DateSource()), CalendarError);
    }
}
