#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>

#include "keygate/keygate_c.h"
#include "protocol/calendar.hpp"
#include "protocol/keyderiver.hpp"
#include "protocol/keyvalidator.hpp"

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

int main() {
    if (keygate_init() != KEYGATE_OK) {
        std::cerr << "Failed to initialize keygate" << std::endl;
        return 1;
    }

    using namespace protocol;

    BenchmarkRunner runner(10000);

    // Short day (small powers) and end of year (largest powers).
    const std::vector<CalendarDate> dates = {
        make_date(2025, 1, 1),
        make_date(2024, 3, 15),
        make_date(2024, 12, 31),
    };

    for (const auto& date : dates) {
        std::cout << "\n--- " << to_string(date) << " (Avg over "
                  << runner.num_iters << " iters) ---" << std::endl;

        runner.run("Key Material", [&]() {
            auto km = keyderiver::compute_key_material(date);
            (void)km;
        });

        runner.run("Derive Normal", [&]() {
            auto keys = keyderiver::derive_normal(date);
            (void)keys;
        });

        runner.run("Derive Shared", [&]() {
            auto key = keyderiver::derive_shared(date);
            (void)key;
        });

        const std::string shared = keyderiver::derive_shared(date);
        runner.run("Validate (elevated)", [&]() {
            auto tier = keyvalidator::validate(shared, date);
            (void)tier;
        });

        runner.run("Validate (rejected)", [&]() {
            auto tier = keyvalidator::validate("not-a-real-key", date);
            (void)tier;
        });
    }

    return 0;
}
