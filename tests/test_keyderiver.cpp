#include <catch2/catch_test_macros.hpp>
#include "protocol/keyderiver.hpp"
#include "test_helpers.hpp"

#include <string>
#include <variant>

using namespace protocol;
using namespace protocol::keyderiver;
using namespace test_helpers;

TEST_CASE("KeyDeriver golden vectors", "[protocol][keyderiver]") {
    init_crypto();

    for (const auto& g : all_golden_vectors()) {
        DYNAMIC_SECTION("key material for " << to_string(g.date)) {
            KeyMaterial km = compute_key_material(g.date);

            REQUIRE(bigint::to_string(km.raw_seed) == g.raw_seed);
            REQUIRE(km.seed_digest == g.seed_digest);
            REQUIRE(bigint::to_string(km.key0_raw) == g.key0_raw);
            REQUIRE(bigint::to_string(km.key1_raw) == g.key1_raw);
            REQUIRE(bigint::to_string(km.key2_raw) == g.key2_raw);
            REQUIRE(bigint::to_string(km.key3_raw) == g.key3_raw);
        }

        DYNAMIC_SECTION("digests for " << to_string(g.date)) {
            REQUIRE(derive_normal(g.date) == g.digests);
            REQUIRE(derive_shared(g.date) == g.shared);
        }
    }
}

TEST_CASE("KeyDeriver properties", "[protocol][keyderiver]") {
    init_crypto();
    const CalendarDate date = make_date(2024, 3, 15);

    SECTION("digests are 64 lowercase hex characters") {
        for (const auto& d : derive_normal(date)) {
            REQUIRE(keygate::utils::is_hex_digest(d));
        }
        REQUIRE(keygate::utils::is_hex_digest(derive_shared(date)));
    }

    SECTION("normal mode yields four ordered digests of the decimal keys") {
        KeyMaterial km = compute_key_material(date);
        DigestSet digests = derive_normal(date);
        REQUIRE(digests.size() == NORMAL_KEY_COUNT);
        REQUIRE(digests[0] == keygate::utils::sha256_hex(bigint::to_string(km.key0_raw)));
        REQUIRE(digests[3] == keygate::utils::sha256_hex(bigint::to_string(km.key3_raw)));
    }

    SECTION("shared digest hashes the hex digests, not the raw keys") {
        KeyMaterial km = compute_key_material(date);
        DigestSet digests = derive_normal(date);

        REQUIRE(derive_shared(date) == keygate::utils::sha256_hex(digests[0] + digests[1]));
        REQUIRE(derive_shared(date) != keygate::utils::sha256_hex(
            bigint::to_string(km.key0_raw) + bigint::to_string(km.key1_raw)));
    }

    SECTION("derivation is deterministic") {
        REQUIRE(derive_normal(date) == derive_normal(date));
        REQUIRE(derive_shared(date) == derive_shared(date));
    }

    SECTION("modes are independent of call order") {
        SharedDigest shared_first = derive_shared(date);
        DigestSet normal_after = derive_normal(date);
        DigestSet normal_first = derive_normal(date);
        SharedDigest shared_after = derive_shared(date);

        REQUIRE(shared_first == shared_after);
        REQUIRE(normal_first == normal_after);
    }

    SECTION("mode dispatch") {
        Derived normal = derive(date, Mode::Normal);
        Derived shared = derive(date, Mode::Shared);

        REQUIRE(std::holds_alternative<DigestSet>(normal));
        REQUIRE(std::holds_alternative<SharedDigest>(shared));
        REQUIRE(std::get<DigestSet>(normal) == derive_normal(date));
        REQUIRE(std::get<SharedDigest>(shared) == derive_shared(date));
    }

    SECTION("unsupported modes are rejected") {
        REQUIRE_THROWS_AS(derive(date, static_cast<Mode>(2)), InvalidModeError);
        REQUIRE_THROWS_AS(mode_from_int(-1), InvalidModeError);
        REQUIRE_THROWS_AS(mode_from_int(7), InvalidModeError);
        REQUIRE_THROWS_AS(parse_mode("admin"), InvalidModeError);
        REQUIRE_THROWS_AS(parse_mode("Normal"), InvalidModeError);
    }

    SECTION("mode names") {
        REQUIRE(parse_mode("normal") == Mode::Normal);
        REQUIRE(parse_mode("shared") == Mode::Shared);
        REQUIRE(mode_from_int(0) == Mode::Normal);
        REQUIRE(mode_from_int(1) == Mode::Shared);
        REQUIRE(mode_name(Mode::Shared) == "shared");
    }

    SECTION("invalid dates are rejected") {
        CalendarDate bad;
        bad.year = 2025;
        bad.month = 2;
        bad.day = 30;
        REQUIRE_THROWS_AS(derive_normal(bad), CalendarError);
    }

    SECTION("0001-12-01 has no keys") {
        // key0 + 1 - month is -1 there, and (-1)^0.8 has no real value
        CalendarDate date = make_date(1, 12, 1);
        REQUIRE_THROWS_AS(derive_normal(date), bigint::BigIntError);
        REQUIRE_THROWS_AS(derive_shared(date), bigint::BigIntError);

        REQUIRE_NOTHROW(derive_normal(make_date(1, 11, 1)));
        REQUIRE_NOTHROW(derive_normal(make_date(1, 12, 2)));
    }
}

TEST_CASE("KeyDeriver day rollover", "[protocol][keyderiver]") {
    init_crypto();

    SECTION("consecutive days produce different keys") {
        for (const auto& date : {make_date(2024, 3, 15), make_date(2024, 2, 28), make_date(2024, 2, 29),
                                 make_date(2024, 12, 31), make_date(2025, 6, 30)}) {
            CalendarDate next = next_day(date);
            REQUIRE(derive_normal(date) != derive_normal(next));
            REQUIRE(derive_shared(date) != derive_shared(next));
        }
    }

    SECTION("the shared digest only covers key0 and key1") {
        // On the first of the month key0 ignores the month and key1 barely
        // moves, so the shared digest repeats while the normal set does not.
        CalendarDate jan = make_date(2024, 1, 1);
        CalendarDate feb = make_date(2024, 2, 1);

        DigestSet jan_keys = derive_normal(jan);
        DigestSet feb_keys = derive_normal(feb);
        REQUIRE(jan_keys[0] == feb_keys[0]);
        REQUIRE(jan_keys[1] == feb_keys[1]);
        REQUIRE(jan_keys[2] != feb_keys[2]);
        REQUIRE(jan_keys[3] != feb_keys[3]);
        REQUIRE(derive_shared(jan) == derive_shared(feb));
    }
}
