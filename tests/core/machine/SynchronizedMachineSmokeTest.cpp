#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>
#include "core/machine/SynchronizedMachine.hpp"
#include "core/sequence/Fibonacci.hpp"
#include "core/sequence/Primes.hpp"

#include <spdlog/spdlog.h>

using namespace mathmachine::core;
using machine::Machine;
using machine::SynchronizedMachine;
using sequence::Fibonacci;
using sequence::Index;
using sequence::Primes;

void smokeTestSynchronizedMachine() {
    std::cout << "Testing SynchronizedMachine basic operations...\n";

    SynchronizedMachine<Fibonacci> shared(Fibonacci{}, 8, 100);
    assert(shared.calculate(10) == 55);
    assert(shared.calculate(10) == 55);
    assert(shared.size() == 1);
    assert(shared.getMetrics().hits == 1);

    auto copy = shared.snapshot();
    assert(copy.cache().contains(10));

    std::cout << "[OK] SynchronizedMachine smoke test\n";
}

void stressTestSynchronizedMachine() {
    std::cout << "Testing SynchronizedMachine from several threads...\n";

    constexpr size_t capacity = 16;
    SynchronizedMachine<Primes> shared(Machine<Primes>(Primes{}, capacity, 32));
    const Primes reference{};

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&shared, &reference, &mismatches, t]() {
            for (int round = 0; round < 50; ++round) {
                for (Index n = 1; n <= 60; ++n) {
                    const Index index = (n + t * 7) % 60 + 1;
                    if (shared.calculate(index) != reference.compute(index, Primes::LookupType{})) {
                        mismatches.fetch_add(1);
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(mismatches.load() == 0);
    assert(shared.size() <= capacity);
    auto metrics = shared.getMetrics();
    assert(metrics.hits + metrics.misses > 0);

    std::cout << "[OK] SynchronizedMachine stress test\n";
}

int main() {
    try {
        smokeTestSynchronizedMachine();
        stressTestSynchronizedMachine();

        spdlog::shutdown();
        std::cout << "All SynchronizedMachine tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
