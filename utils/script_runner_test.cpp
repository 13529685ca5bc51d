#include "script_runner.hpp"

#include "BpTreeMap.hpp"
#include "LinearHashMap.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using indexmaps::script::runScript;

namespace {
    using HashMap = indexmaps::LinearHashMap<long long, long long>;
    using TreeMap = indexmaps::BpTreeMap<long long, long long>;

    bool has(const std::ostringstream &os, const std::string &text) {
        return os.str().find(text) != std::string::npos;
    }
} // namespace

void test_tree_script() {
    std::cout << "=== tree script ===\n";
    std::istringstream in(
        "put 1 1\n"
        "put 3 9\n"
        "put 5 25\n"
        "put 7 49\n"
        "put 9 81\n"
        "put 3 0\n"
        "get 3\n"
        "size\n"
        "first\n"
        "last\n"
        "sub 3 8\n"
        "sub 8 3\n"
        "head 5\n"
        "tail 7\n");
    std::ostringstream out;
    std::ostringstream err;
    TreeMap bpt;
    assert(runScript(bpt, in, out, err) == 0);
    std::cout << out.str() << err.str();

    // the duplicate is reported and the rest of the script still runs
    assert(has(err, "line 6: attempt to insert duplicate key = 3"));
    assert(has(out, "get 3 = 9\n"));
    assert(has(out, "size = 5\n"));
    assert(has(out, "first = 1\n"));
    assert(has(out, "last = 9\n"));
    assert(has(out, "{3=9, 5=25, 7=49}\n"));
    assert(has(err, "line 12: sub: fromKey > toKey"));
    assert(has(out, "{1=1, 3=9}\n"));
    assert(has(out, "{7=49, 9=81}\n"));
    assert(has(out, "Accesses = "));
    assert(bpt.size() == 5);
    std::cout << "[OK] tree script passed\n";
}

void test_hash_script() {
    std::cout << "=== hash script ===\n";
    std::istringstream in(
        "# overwrite, then ordered commands\n"
        "put 1 1\n"
        "PUT 1 2\n"
        "get 1\n"
        "get 2\n"
        "size\n"
        "first\n"
        "sub 1 2\n"
        "print\n");
    std::ostringstream out;
    std::ostringstream err;
    HashMap ht(11);
    assert(runScript(ht, in, out, err) == 0);
    std::cout << out.str() << err.str();

    assert(has(out, "put 1 = 2 (was 1)\n"));
    assert(has(out, "get 1 = 2\n"));
    assert(has(out, "get 2 = null\n"));
    assert(has(out, "size = 1\n"));
    assert(has(err, "line 7: first is not supported by the hash map"));
    assert(has(err, "line 8: sub is not supported by the hash map"));
    assert(has(out, "Hash Table (Linear Hashing)"));
    assert(has(out, " | key=1, value=2"));
    std::cout << "[OK] hash script passed\n";
}

void test_malformed_script() {
    std::cout << "=== malformed script ===\n";
    std::istringstream in("put 1 1\nget\nput 2 2\n");
    std::ostringstream out;
    std::ostringstream err;
    TreeMap bpt;
    assert(runScript(bpt, in, out, err) == 1);
    assert(has(err, "script error: line 2"));
    // nothing runs when a line is malformed
    assert(out.str().empty());
    assert(bpt.empty());
    std::cout << "[OK] malformed script passed\n";
}

int main() {
    test_tree_script();
    test_hash_script();
    test_malformed_script();
    std::cout << "\nAll tests passed ✔\n";
    return 0;
}
