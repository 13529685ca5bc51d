#include <algorithm>
#include <cassert>
#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "BpTreeMap.hpp"
#include "utils/index_errors.hpp"

using indexmaps::BpTreeMap;
using indexmaps::DuplicateKeyError;

void testOddKeysScenario() {
    std::cout << "\n=== Odd keys 1..9 ===\n";
    BpTreeMap<int, int> bpt;
    for (int i = 1; i < 10; i += 2) {
        assert(!bpt.put(i, i * i).has_value());
    }
    bpt.validate();

    assert(bpt.size() == 5);
    assert(bpt.firstKey() == 1);
    assert(bpt.lastKey() == 9);
    const std::map<int, int> expected {{3, 9}, {5, 25}, {7, 49}};
    assert(bpt.subMap(3, 8) == expected);
    assert(bpt.get(7) == 49);
    assert(!bpt.get(4).has_value());
    std::cout << "[OK] odd keys scenario passed\n";
}

void testDuplicateRejected() {
    std::cout << "\n=== Duplicate keys ===\n";
    BpTreeMap<int, std::string> bpt;
    bpt.put(5, "five");
    bpt.put(6, "six");

    bool threw = false;
    try {
        bpt.put(5, "FIVE");
    } catch (const DuplicateKeyError &e) {
        std::cout << "rejected: " << e.what() << "\n";
        assert(e.key() == "5");
        threw = true;
    }
    assert(threw);
    assert(bpt.get(5) == "five");
    assert(bpt.size() == 2);

    // also catchable as the standard base
    threw = false;
    try {
        bpt.put(6, "SIX");
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    assert(!bpt.insert(5, "again"));
    assert(bpt.insert(7, "seven"));
    assert(bpt.size() == 3);
    bpt.validate();
    std::cout << "[OK] duplicate rejection test passed\n";
}

void testRootSplit() {
    std::cout << "\n=== Root split (order 5) ===\n";
    BpTreeMap<int, int> bpt;
    for (int k = 1; k <= 4; ++k) {
        bpt.put(k, k);
    }
    assert(bpt.height() == 1);

    bpt.put(5, 5);
    assert(bpt.height() == 2);
    bpt.validate();

    std::ostringstream os;
    bpt.print(os);
    const std::string dump = os.str();
    std::cout << dump;
    // lower Order/2 pairs stay left, the sibling's first key goes up
    assert(dump.find("[ . 3 . ]\n") != std::string::npos);
    assert(dump.find("\t[ . 1 . 2 . ]\n") != std::string::npos);
    assert(dump.find("\t[ . 3 . 4 . 5 . ]\n") != std::string::npos);
    std::cout << "[OK] root split test passed\n";
}

template<std::size_t Order>
void checkInsertOrder(const std::vector<int> &keys, const char *label) {
    BpTreeMap<int, int, std::less<int>, Order> bpt;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        assert(bpt.insert(keys[i], -keys[i]));
        if (i % 50 == 0) {
            bpt.validate();
        }
    }
    bpt.validate();

    assert(bpt.size() == keys.size());
    assert(bpt.height() > 1);
    const auto all = bpt.entries();
    assert(all.size() == keys.size());
    for (std::size_t i = 1; i < all.size(); ++i) {
        assert(all[i - 1].first < all[i].first);
    }
    for (const int k: keys) {
        assert(bpt.get(k) == -k);
    }
    assert(bpt.firstKey() == *std::ranges::min_element(keys));
    assert(bpt.lastKey() == *std::ranges::max_element(keys));
    std::cout << "order " << Order << ", " << label << ": height " << bpt.height() << "\n";
}

void testOrdersAndInsertPatterns() {
    std::cout << "\n=== Insert patterns across orders ===\n";
    std::vector<int> ascending(1000);
    std::iota(ascending.begin(), ascending.end(), 0);
    std::vector<int> descending(ascending.rbegin(), ascending.rend());
    std::vector<int> shuffled = ascending;
    std::mt19937 rng(2024);
    std::ranges::shuffle(shuffled, rng);

    checkInsertOrder<3>(ascending, "ascending");
    checkInsertOrder<3>(descending, "descending");
    checkInsertOrder<3>(shuffled, "shuffled");
    checkInsertOrder<4>(ascending, "ascending");
    checkInsertOrder<4>(shuffled, "shuffled");
    checkInsertOrder<5>(descending, "descending");
    checkInsertOrder<5>(shuffled, "shuffled");
    checkInsertOrder<16>(shuffled, "shuffled");
    std::cout << "[OK] insert pattern tests passed\n";
}

void testRangesAgainstStdMap() {
    std::cout << "\n=== Range queries vs std::map ===\n";
    BpTreeMap<int, int> bpt;
    std::map<int, int> ref;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> keyDist(0, 1999);

    for (int n = 0; n < 800; ++n) {
        const int k = keyDist(rng);
        const bool fresh = ref.emplace(k, k * 2).second;
        assert(bpt.insert(k, k * 2) == fresh);
    }
    bpt.validate();
    assert(bpt.size() == ref.size());

    std::uniform_int_distribution<int> boundDist(-10, 2010);
    for (int q = 0; q < 300; ++q) {
        int from = boundDist(rng);
        int to = boundDist(rng);
        if (to < from) {
            std::swap(from, to);
        }
        const std::map<int, int> head(ref.begin(), ref.lower_bound(to));
        const std::map<int, int> tail(ref.lower_bound(from), ref.end());
        const std::map<int, int> sub(ref.lower_bound(from), ref.lower_bound(to));
        assert(bpt.headMap(to) == head);
        assert(bpt.tailMap(from) == tail);
        assert(bpt.subMap(from, to) == sub);
    }

    // bounds that hit stored keys exactly
    const int lo = ref.begin()->first;
    const int hi = ref.rbegin()->first;
    assert(bpt.headMap(lo).empty());
    assert(bpt.tailMap(hi).size() == 1);
    assert(bpt.subMap(lo, lo).empty());
    assert(bpt.subMap(lo, hi).size() == ref.size() - 1);
    std::cout << "[OK] range query tests passed\n";
}

void testEmptyTree() {
    std::cout << "\n=== Empty tree ===\n";
    BpTreeMap<int, int> bpt;
    assert(bpt.empty());
    assert(bpt.size() == 0);
    assert(bpt.height() == 1);
    assert(!bpt.firstKey().has_value());
    assert(!bpt.lastKey().has_value());
    assert(!bpt.get(1).has_value());
    assert(bpt.find(1) == nullptr);
    assert(bpt.headMap(10).empty());
    assert(bpt.tailMap(-10).empty());
    assert(bpt.entries().empty());
    bpt.validate();
    std::cout << "[OK] empty tree test passed\n";
}

void testReversedSubMapThrows() {
    std::cout << "\n=== subMap(from > to) ===\n";
    BpTreeMap<int, int> bpt;
    bpt.put(1, 1);
    bool threw = false;
    try {
        static_cast<void>(bpt.subMap(8, 3));
    } catch (const std::invalid_argument &e) {
        std::cout << "threw: " << e.what() << "\n";
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] reversed subMap test passed\n";
}

void testDescendingComparator() {
    std::cout << "\n=== std::greater ordering ===\n";
    BpTreeMap<int, int, std::greater<int>> bpt;
    for (int k = 1; k <= 10; ++k) {
        bpt.put(k, k * 10);
    }
    bpt.validate();
    assert(bpt.firstKey() == 10);
    assert(bpt.lastKey() == 1);

    const std::map<int, int, std::greater<int>> expected {{8, 80}, {7, 70}, {6, 60}, {5, 50}, {4, 40}};
    assert(bpt.subMap(8, 3) == expected);

    const auto all = bpt.entries();
    assert(all.front().first == 10 && all.back().first == 1);
    std::cout << "[OK] descending comparator test passed\n";
}

void testStringKeysAndFind() {
    std::cout << "\n=== String keys / find() ===\n";
    BpTreeMap<std::string, int> bpt;
    for (const char *w: {"pear", "apple", "fig", "kiwi", "banana", "cherry", "date", "grape"}) {
        bpt.put(w, static_cast<int>(std::string(w).size()));
    }
    bpt.validate();
    assert(bpt.firstKey() == "apple");
    assert(bpt.lastKey() == "pear");
    assert(bpt.headMap("c").size() == 2);

    int *v = bpt.find("kiwi");
    assert(v && *v == 4);
    *v = 40;
    assert(bpt.get("kiwi") == 40);
    assert(bpt.contains("fig"));
    assert(!bpt.contains("lime"));
    std::cout << "[OK] string keys test passed\n";
}

void testAccessCounter() {
    std::cout << "\n=== Access counter ===\n";
    BpTreeMap<int, int> bpt;
    for (int k = 0; k < 200; ++k) {
        bpt.put(k, k);
    }
    bpt.resetAccessCount();
    assert(bpt.accessCount() == 0);
    static_cast<void>(bpt.get(123));
    // one node per level on the way down
    assert(bpt.accessCount() == bpt.height());
    std::cout << "[OK] access counter test passed\n";
}

void testMoveAndSwap() {
    std::cout << "\n=== Move / swap ===\n";
    BpTreeMap<int, int> a;
    BpTreeMap<int, int> b;
    for (int k = 0; k < 30; ++k) {
        a.put(k, k);
    }
    b.put(-1, -1);
    swap(a, b);
    assert(a.size() == 1 && a.firstKey() == -1);
    assert(b.size() == 30 && b.lastKey() == 29);

    BpTreeMap<int, int> c(std::move(b));
    assert(c.size() == 30);
    c.validate();

    // the moved-from tree is an empty leaf root and still takes inserts
    assert(b.empty());
    assert(b.size() == 0);
    assert(b.height() == 1);
    assert(!b.get(3).has_value());
    assert(!b.firstKey().has_value());
    std::ostringstream dump;
    b.print(dump);
    assert(dump.str().find("[ . ]") != std::string::npos);
    for (int k = 0; k < 12; ++k) {
        b.put(k, k * k);
    }
    assert(b.size() == 12 && b.get(11) == 121);
    b.validate();

    // move assignment hands the old contents back to the source
    c = std::move(a);
    assert(c.size() == 1 && c.firstKey() == -1);
    assert(a.size() == 30 && a.lastKey() == 29);
    a.put(30, 30);
    assert(a.lastKey() == 30);
    a.validate();
    std::cout << "[OK] move/swap test passed\n";
}

int main() {
    std::cout << "=== Starting BpTreeMap tests ===\n";
    testOddKeysScenario();
    testDuplicateRejected();
    testRootSplit();
    testOrdersAndInsertPatterns();
    testRangesAgainstStdMap();
    testEmptyTree();
    testReversedSubMapThrows();
    testDescendingComparator();
    testStringKeysAndFind();
    testAccessCounter();
    testMoveAndSwap();
    std::cout << "\nAll tests passed ✔\n";
    return 0;
}
