#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <vector>
#include "core/sequence/Fibonacci.hpp"
#include "core/sequence/Harmonic.hpp"
#include "core/sequence/Primes.hpp"
#include "core/sequence/SequenceError.hpp"

using namespace mathmachine::core::sequence;

namespace {

template<typename Strategy>
void expectError(const Strategy& strategy, Index n, SequenceErrc expected) {
    try {
        strategy.compute(n, typename Strategy::LookupType{});
        assert(false && "SequenceError expected");
    } catch (const SequenceError& e) {
        assert(e.code() == expected);
        assert(e.index() == n);
    }
}

} // namespace

void testFibonacciValues() {
    std::cout << "Testing Fibonacci values...\n";

    Fibonacci fibonacci;
    const Lookup<IntValue> none;
    assert(fibonacci.compute(0, none) == 0);
    assert(fibonacci.compute(1, none) == 1);
    assert(fibonacci.compute(2, none) == 1);
    assert(fibonacci.compute(10, none) == 55);
    assert(fibonacci.compute(26, none) == 121393);
    assert(fibonacci.compute(Fibonacci::MAX_INDEX, none) == 12200160415121876738ULL);
    assert(fibonacci.name() == "fibonacci");

    std::cout << "[OK] Fibonacci values test\n";
}

void testFibonacciLookup() {
    std::cout << "Testing Fibonacci lookup usage...\n";

    Fibonacci fibonacci;
    std::vector<Index> requested;

    // Оба соседних члена есть: результат собирается из них, сначала запрашивается n-2
    const Lookup<IntValue> full = [&requested](Index index) -> std::optional<IntValue> {
        requested.push_back(index);
        if (index == 8) return 21;
        if (index == 9) return 34;
        return std::nullopt;
    };
    assert(fibonacci.compute(10, full) == 55);
    assert(requested.size() == 2);
    assert(requested[0] == 8);
    assert(requested[1] == 9);

    // Только один член есть: пары нет, вычисление от F(0), F(1)
    requested.clear();
    const Lookup<IntValue> partial = [&requested](Index index) -> std::optional<IntValue> {
        requested.push_back(index);
        if (index == 19) return 4181;
        return std::nullopt;
    };
    assert(fibonacci.compute(20, partial) == 6765);
    assert(requested.size() == 19); // 18, 17, ..., 0; до 19 дело не доходит
    assert(requested.front() == 18 && requested.back() == 0);

    // Базовые случаи не обращаются к lookup
    requested.clear();
    assert(fibonacci.compute(1, full) == 1);
    assert(requested.empty());

    std::cout << "[OK] Fibonacci lookup test\n";
}

void testFibonacciResumesFromClosestPair() {
    std::cout << "Testing Fibonacci resumes from the closest cached pair...\n";

    Fibonacci fibonacci;
    const Lookup<IntValue> none;
    const IntValue f10 = fibonacci.compute(10, none);
    const IntValue f11 = fibonacci.compute(11, none);
    const IntValue f40 = fibonacci.compute(40, none);
    const IntValue f41 = fibonacci.compute(41, none);

    std::vector<Index> requested;
    const Lookup<IntValue> cached = [&](Index index) -> std::optional<IntValue> {
        requested.push_back(index);
        if (index == 10) return f10;
        if (index == 11) return f11;
        if (index == 40) return f40;
        if (index == 41) return f41;
        return std::nullopt;
    };
    assert(fibonacci.compute(60, cached) == 1548008755920ULL);

    // Поиск сверху вниз останавливается на паре (40, 41), до (10, 11) не доходит
    assert(requested.front() == 58);
    assert(requested.back() == 40);
    assert(requested.size() == 19);
    for (Index index : requested) {
        assert(index >= 40 && index <= 58);
    }

    std::cout << "[OK] Fibonacci closest pair test\n";
}

void testFibonacciErrors() {
    std::cout << "Testing Fibonacci domain errors...\n";

    Fibonacci fibonacci;
    expectError(fibonacci, -1, SequenceErrc::InvalidIndex);
    expectError(fibonacci, Fibonacci::MAX_INDEX + 1, SequenceErrc::Overflow);
    expectError(fibonacci, std::numeric_limits<Index>::max(), SequenceErrc::Overflow);

    std::cout << "[OK] Fibonacci errors test\n";
}

void testPrimesValues() {
    std::cout << "Testing Primes values...\n";

    Primes primes;
    const Lookup<IntValue> none;
    assert(primes.compute(1, none) == 2);
    assert(primes.compute(2, none) == 3);
    assert(primes.compute(3, none) == 5);
    assert(primes.compute(10, none) == 29);
    assert(primes.compute(26, none) == 101);
    assert(primes.compute(100, none) == 541);
    assert(primes.name() == "primes");

    std::cout << "[OK] Primes values test\n";
}

void testPrimesHelpers() {
    std::cout << "Testing Primes helpers...\n";

    assert(!Primes::isPrime(0));
    assert(!Primes::isPrime(1));
    assert(Primes::isPrime(2));
    assert(Primes::isPrime(3));
    assert(!Primes::isPrime(98));
    assert(!Primes::isPrime(144));
    assert(Primes::isPrime(181));
    assert(!Primes::isPrime(25));
    assert(Primes::isPrime(1000003));

    assert(Primes::nextPrime(0) == 2);
    assert(Primes::nextPrime(2) == 3);
    assert(Primes::nextPrime(3517) == 3527);
    assert(Primes::nextPrime(7489) == 7499);
    assert(Primes::nextPrime(24) == 29);
    assert(!Primes::nextPrime(std::numeric_limits<IntValue>::max()));
    assert(!Primes::nextPrime(std::numeric_limits<IntValue>::max() - 1));

    std::cout << "[OK] Primes helpers test\n";
}

void testPrimesLookup() {
    std::cout << "Testing Primes lookup usage...\n";

    Primes primes;
    std::vector<Index> requested;
    const Lookup<IntValue> seeded = [&requested](Index index) -> std::optional<IntValue> {
        requested.push_back(index);
        if (index == 10) return 29;
        return std::nullopt;
    };
    assert(primes.compute(11, seeded) == 31);
    assert(requested.size() == 1 && requested[0] == 10);

    // Промах по n-1: поиск продолжается от ближайшего P(10)
    requested.clear();
    assert(primes.compute(12, seeded) == 37);
    assert(requested.size() == 2 && requested[0] == 11 && requested[1] == 10);

    // Ничего не закэшировано: поиск с начала
    requested.clear();
    assert(primes.compute(5, seeded) == 11);
    assert(requested.size() == 4 && requested.back() == 1);

    std::cout << "[OK] Primes lookup test\n";
}

void testPrimesResumesFromClosest() {
    std::cout << "Testing Primes resumes from the closest cached prime...\n";

    Primes primes;
    const Lookup<IntValue> none;
    const IntValue p1000 = primes.compute(1000, none);
    assert(p1000 == 7919);

    std::vector<Index> requested;
    const Lookup<IntValue> cached = [&](Index index) -> std::optional<IntValue> {
        requested.push_back(index);
        if (index == 1000) return p1000;
        if (index == 3) return 5;
        return std::nullopt;
    };
    assert(primes.compute(1500, cached) == primes.compute(1500, none));
    assert(requested.size() == 500);
    assert(requested.front() == 1499);
    assert(requested.back() == 1000);

    // Засеянное значение действительно используется: подмена P(1000) меняет результат
    const Lookup<IntValue> shifted = [](Index index) -> std::optional<IntValue> {
        if (index == 1000) return 7;
        return std::nullopt;
    };
    assert(primes.compute(1002, shifted) == 13);

    std::cout << "[OK] Primes closest prime test\n";
}

void testPrimesErrors() {
    std::cout << "Testing Primes domain errors...\n";

    Primes primes;
    expectError(primes, 0, SequenceErrc::InvalidIndex);
    expectError(primes, -5, SequenceErrc::InvalidIndex);

    // Предыдущий член на границе IntValue: следующего простого нет
    const Lookup<IntValue> atLimit = [](Index) -> std::optional<IntValue> {
        return std::numeric_limits<IntValue>::max();
    };
    try {
        primes.compute(7, atLimit);
        assert(false && "SequenceError expected");
    } catch (const SequenceError& e) {
        assert(e.code() == SequenceErrc::Overflow);
    }

    std::cout << "[OK] Primes errors test\n";
}

void testHarmonic() {
    std::cout << "Testing Harmonic values...\n";

    Harmonic harmonic;
    const Lookup<double> none;
    assert(harmonic.compute(0, none) == 0.0);
    assert(harmonic.compute(1, none) == 1.0);
    assert(harmonic.compute(2, none) == 1.5);
    assert(std::fabs(harmonic.compute(4, none) - 25.0 / 12.0) < 1e-12);

    // Значение через lookup совпадает с вычисленным заново побитно
    const double h9 = harmonic.compute(9, none);
    const Lookup<double> seeded = [h9](Index index) -> std::optional<double> {
        if (index == 9) return h9;
        return std::nullopt;
    };
    assert(harmonic.compute(10, seeded) == harmonic.compute(10, none));

    // Продолжение суммы от ближайшего H(k), а не только от H(n-1)
    const double h5 = harmonic.compute(5, none);
    std::vector<Index> requested;
    const Lookup<double> distant = [&requested, h5](Index index) -> std::optional<double> {
        requested.push_back(index);
        if (index == 5) return h5;
        return std::nullopt;
    };
    assert(harmonic.compute(10, distant) == harmonic.compute(10, none));
    assert(requested.size() == 5 && requested.back() == 5);

    expectError(harmonic, -1, SequenceErrc::InvalidIndex);
    assert(harmonic.name() == "harmonic");

    std::cout << "[OK] Harmonic test\n";
}

void testErrorMessages() {
    std::cout << "Testing SequenceError messages...\n";

    SequenceError error(SequenceErrc::InvalidIndex, -3, "fibonacci");
    const std::string message = error.what();
    assert(message.find("fibonacci") != std::string::npos);
    assert(message.find("-3") != std::string::npos);
    assert(std::string(toString(SequenceErrc::Overflow)) == "overflow");

    std::cout << "[OK] SequenceError messages test\n";
}

int main() {
    try {
        testFibonacciValues();
        testFibonacciLookup();
        testFibonacciResumesFromClosestPair();
        testFibonacciErrors();
        testPrimesValues();
        testPrimesHelpers();
        testPrimesLookup();
        testPrimesResumesFromClosest();
        testPrimesErrors();
        testHarmonic();
        testErrorMessages();
        std::cout << "All sequence strategy tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
