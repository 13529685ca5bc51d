#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "BpTreeMap.hpp"
#include "LinearHashMap.hpp"
#include "utils/command_script.hpp"
#include "utils/script_runner.hpp"

namespace {

using HashMap = indexmaps::LinearHashMap<long long, long long>;
using TreeMap = indexmaps::BpTreeMap<long long, long long>;

void usage(std::ostream &os) {
    os << "usage:\n"
       << "  indexmaps hash [nKeys]        linear hashing demo (default nKeys = 30)\n"
       << "  indexmaps tree [nKeys]        B+Tree demo (default nKeys = 10)\n"
       << "  indexmaps script hash|tree    run commands from stdin\n"
       << "\n"
       << "script commands: put k v | get k | size | first | last | head to | tail from\n"
       << "                 | sub from to | print | # comment\n";
}

// ---------------------------------------------------------------------------
// Demos: insert the odd keys below nKeys with value key², dump, look everything up
// ---------------------------------------------------------------------------
int linHashDemo(const int nKeys) {
    std::cout << "=== LinearHashMap demo (initSize = 11, nKeys = " << nKeys << ") ===\n";
    HashMap ht(11);
    for (long long i = 1; i < nKeys; i += 2) {
        ht.put(i, i * i);
    }
    ht.print();
    for (long long i = 0; i < nKeys; ++i) {
        std::cout << "key = " << i << " value = " << indexmaps::script::show(ht.get(i)) << "\n";
    }
    std::cout << "-------------------------------------------\n";
    std::cout << "Average number of buckets accessed = "
              << static_cast<double>(ht.accessCount()) / static_cast<double>(nKeys) << "\n";
    return 0;
}

int bpTreeDemo(const int nKeys) {
    std::cout << "=== BpTreeMap demo (order = " << TreeMap::order << ", nKeys = " << nKeys << ") ===\n";
    TreeMap bpt;
    for (long long i = 1; i < nKeys; i += 2) {
        bpt.put(i, i * i);
    }
    bpt.print();
    for (long long i = 0; i < nKeys; ++i) {
        std::cout << "key = " << i << " value = " << indexmaps::script::show(bpt.get(i)) << "\n";
    }
    std::cout << "-------------------------------------------\n";
    std::cout << "Average number of nodes accessed = "
              << static_cast<double>(bpt.accessCount()) / static_cast<double>(nKeys) << "\n";
    return 0;
}

int parseKeys(const char *arg, const int fallback) {
    return arg ? indexmaps::script::parse_count(arg) : fallback;
}

} // namespace

int main(const int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        usage(std::cerr);
        return 1;
    }
    const std::string_view mode = argv[1];
    const char *extra = argc == 3 ? argv[2] : nullptr;

    try {
        if (mode == "hash") {
            return linHashDemo(parseKeys(extra, 30));
        }
        if (mode == "tree") {
            return bpTreeDemo(parseKeys(extra, 10));
        }
        if (mode == "script" && extra) {
            const std::string_view which = extra;
            if (which == "hash") {
                HashMap ht(11);
                return indexmaps::script::runScript(ht, std::cin, std::cout, std::cerr);
            }
            if (which == "tree") {
                TreeMap bpt;
                return indexmaps::script::runScript(bpt, std::cin, std::cout, std::cerr);
            }
        }
    } catch (const std::invalid_argument &e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        usage(std::cerr);
        return 1;
    } catch (const std::out_of_range &e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        usage(std::cerr);
        return 1;
    }

    usage(std::cerr);
    return 1;
}
