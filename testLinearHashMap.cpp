#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "LinearHashMap.hpp"

using indexmaps::LinearHashMap;

// Every key lands in the same home chain.
struct AllZeroHash {
    std::size_t operator()(const int) const noexcept {
        return 0u;
    }
};

void testOddKeysScenario() {
    std::cout << "\n=== Odd keys, initSize = 11 ===\n";
    LinearHashMap<int, int> ht(11);
    for (int i = 1; i < 30; i += 2) {
        assert(!ht.put(i, i * i).has_value());
    }
    ht.validate();

    assert(ht.size() == 15);
    assert(ht.get(15) == 225);
    assert(!ht.get(2).has_value());
    for (int i = 0; i < 30; ++i) {
        assert(ht.contains(i) == (i % 2 == 1));
    }
    std::cout << "[OK] odd keys scenario passed\n";
}

void testOverwriteReturnsPrevious() {
    std::cout << "\n=== put() on an existing key ===\n";
    LinearHashMap<int, std::string> ht(4);
    assert(!ht.put(7, "seven").has_value());
    const auto prev = ht.put(7, "SEVEN");
    assert(prev.has_value() && *prev == "seven");
    assert(ht.size() == 1);
    assert(ht.get(7) == "SEVEN");

    // the same through find()
    std::string *v = ht.find(7);
    assert(v && *v == "SEVEN");
    *v = "7";
    assert(ht.get(7) == "7");
    assert(ht.find(8) == nullptr);
    ht.validate();
    std::cout << "[OK] overwrite test passed\n";
}

void testFirstSplit() {
    std::cout << "\n=== First split ===\n";
    // std::hash<int> is the identity on the usual implementations, so pick keys by residue.
    LinearHashMap<int, int, std::hash<int>> ht(4);
    assert(ht.capacity() == 16);
    assert(ht.bucketCount() == 4);

    for (const int k: {0, 4, 8, 12}) {
        ht.put(k, k);
    }
    if (ht.homeIndex(4) != 0) {
        std::cout << "std::hash<int> is not the identity here, skipping exact layout checks\n";
        return;
    }
    assert(ht.splitCount() == 0);
    assert(ht.chainLength(0) == 1);

    ht.put(16, 16); // fifth key in chain 0 needs an overflow bucket
    assert(ht.splitCount() == 1);
    assert(ht.splitPointer() == 1);
    assert(ht.bucketCount() == 5);
    assert(ht.capacity() == 4 * (4 + 1));
    // 0, 8, 16 stay (mod 8 == 0), 4 and 12 move to 4
    assert(ht.homeIndex(8) == 0);
    assert(ht.homeIndex(4) == 4);
    assert(ht.chainLength(0) == 1);
    assert(ht.chainLength(4) == 1);
    for (const int k: {0, 4, 8, 12, 16}) {
        assert(ht.get(k) == k);
    }
    ht.validate();
    std::cout << "[OK] first split test passed\n";
}

void testGenerationRollover() {
    std::cout << "\n=== Generation rollover ===\n";
    LinearHashMap<int, int> ht(2);
    if (ht.homeIndex(3) != 1) {
        std::cout << "std::hash<int> is not the identity here, skipping\n";
        return;
    }
    for (const int k: {0, 2, 4, 6, 8}) {
        ht.put(k, -k);
    }
    assert(ht.splitCount() == 1);
    assert(ht.mod1() == 2 && ht.splitPointer() == 1);

    for (const int k: {1, 3, 5, 7, 9}) {
        ht.put(k, -k);
    }
    assert(ht.splitCount() == 2);
    assert(ht.mod1() == 4);
    assert(ht.mod2() == 8);
    assert(ht.splitPointer() == 0);
    assert(ht.bucketCount() == 4);
    for (int k = 0; k < 10; ++k) {
        assert(ht.get(k) == -k);
    }
    ht.validate();
    std::cout << "[OK] generation rollover test passed\n";
}

void testGrowthKeepsEveryKey() {
    std::cout << "\n=== Growth invariant (5000 shuffled keys) ===\n";
    constexpr int N = 5000;
    std::vector<int> keys(N);
    std::iota(keys.begin(), keys.end(), 0);
    std::mt19937 rng(12345);
    std::ranges::shuffle(keys, rng);

    LinearHashMap<int, int> ht(4);
    for (int i = 0; i < N; ++i) {
        ht.put(keys[i], keys[i] * 3);
        if (i % 97 == 0) {
            ht.validate();
        }
    }
    ht.validate();

    assert(ht.size() == static_cast<std::size_t>(N));
    assert(ht.splitCount() > 0);
    assert(ht.bucketCount() == ht.mod1() + ht.splitPointer());
    assert((ht.capacity() == LinearHashMap<int, int>::slots_per_bucket * ht.bucketCount()));
    for (int k = 0; k < N; ++k) {
        const auto v = ht.get(k);
        assert(v.has_value() && *v == k * 3);
    }
    assert(!ht.get(N).has_value());
    assert(!ht.get(-1).has_value());

    std::cout << "buckets=" << ht.bucketCount() << " splits=" << ht.splitCount() << "\n";
    std::cout << "[OK] growth invariant test passed\n";
}

void testCollidingKeysStayDistinct() {
    std::cout << "\n=== Colliding hashes ===\n";
    LinearHashMap<int, int, AllZeroHash> ht(3);
    for (int k = 0; k < 200; ++k) {
        assert(!ht.put(k, k + 1000).has_value());
    }
    ht.validate();
    assert(ht.size() == 200);
    // one chain of full buckets
    assert(ht.chainLength(0) == 50);
    for (int k = 0; k < 200; ++k) {
        assert(ht.get(k) == k + 1000);
    }
    const auto prev = ht.put(123, 0);
    assert(prev == 1123);
    assert(ht.size() == 200);
    std::cout << "[OK] colliding hashes test passed\n";
}

void testEntries() {
    std::cout << "\n=== entries() / forEach() ===\n";
    LinearHashMap<int, int> ht(5);
    for (int k = 0; k < 64; ++k) {
        ht.put(k, k * k);
    }
    auto all = ht.entries();
    assert(all.size() == 64);
    std::ranges::sort(all);
    for (int k = 0; k < 64; ++k) {
        assert(all[k].first == k && all[k].second == k * k);
    }

    long long sum = 0;
    ht.forEach([&sum](const int, const int v) { sum += v; });
    assert(sum == 63LL * 64 * 127 / 6);
    std::cout << "[OK] entries test passed\n";
}

void testStringKeys() {
    std::cout << "\n=== String keys ===\n";
    LinearHashMap<std::string, int> ht(2);
    for (int i = 0; i < 100; ++i) {
        ht.put("key" + std::to_string(i), i);
    }
    ht.validate();
    assert(ht.size() == 100);
    assert(ht.get("key42") == 42);
    assert(!ht.get("key100").has_value());
    std::cout << "[OK] string keys test passed\n";
}

void testAccessCounter() {
    std::cout << "\n=== Access counter ===\n";
    LinearHashMap<int, int> ht(11);
    assert(ht.accessCount() == 0);
    // home chain not created yet, nothing visited
    assert(!ht.get(5).has_value());
    assert(ht.accessCount() == 0);

    ht.put(5, 25);
    assert(ht.accessCount() == 1);
    ht.resetAccessCount();
    assert(ht.get(5) == 25);
    assert(ht.accessCount() == 1);
    std::cout << "[OK] access counter test passed\n";
}

void testErrorsAndDiagnostics() {
    std::cout << "\n=== Errors and diagnostics ===\n";
    bool threw = false;
    try {
        LinearHashMap<int, int> bad(0);
    } catch (const std::invalid_argument &e) {
        std::cout << "initSize 0 threw: " << e.what() << "\n";
        threw = true;
    }
    assert(threw);

    LinearHashMap<int, int> ht(3);
    ht.put(1, 1);
    threw = false;
    try {
        static_cast<void>(ht.chainLength(ht.bucketCount()));
    } catch (const std::out_of_range &) {
        threw = true;
    }
    assert(threw);

    std::ostringstream dump;
    ht.print(dump);
    assert(dump.str().find("**** BUCKET 0 ****") != std::string::npos);
    assert(dump.str().find("key=1, value=1") != std::string::npos);

    std::ostringstream dbg;
    ht.debugKey(1, dbg);
    assert(dbg.str().find("home=") != std::string::npos);
    std::cout << dump.str();
    std::cout << "[OK] errors and diagnostics test passed\n";
}

void testMoveAndSwap() {
    std::cout << "\n=== Move / swap ===\n";
    LinearHashMap<int, int> a(4);
    LinearHashMap<int, int> b(4);
    for (int k = 0; k < 20; ++k) {
        a.put(k, k);
    }
    b.put(100, 100);
    swap(a, b);
    assert(a.size() == 1 && a.get(100) == 100);
    assert(b.size() == 20 && b.get(19) == 19);

    LinearHashMap<int, int> c(std::move(b));
    assert(c.size() == 20);
    c.validate();

    // the moved-from map is empty and still takes inserts
    assert(b.empty());
    assert(b.bucketCount() == b.mod1());
    assert(!b.get(19).has_value());
    for (int k = 0; k < 40; ++k) {
        assert(!b.put(k, -k).has_value());
    }
    assert(b.size() == 40 && b.get(39) == -39);
    b.validate();

    // move assignment hands the old contents back to the source
    c = std::move(a);
    assert(c.size() == 1 && c.get(100) == 100);
    assert(a.size() == 20 && a.get(0) == 0);
    a.put(500, 5);
    assert(a.get(500) == 5);
    a.validate();
    c.validate();
    std::cout << "[OK] move/swap test passed\n";
}

int main() {
    std::cout << "=== Starting LinearHashMap tests ===\n";
    testOddKeysScenario();
    testOverwriteReturnsPrevious();
    testFirstSplit();
    testGenerationRollover();
    testGrowthKeepsEveryKey();
    testCollidingKeysStayDistinct();
    testEntries();
    testStringKeys();
    testAccessCounter();
    testErrorsAndDiagnostics();
    testMoveAndSwap();
    std::cout << "\nAll tests passed ✔\n";
    return 0;
}
