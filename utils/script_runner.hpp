#ifndef INDEXMAPS_SCRIPT_RUNNER_HPP
#define INDEXMAPS_SCRIPT_RUNNER_HPP

#include "command_script.hpp"
#include "index_errors.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace indexmaps::script {

/** @brief A looked-up value, or "null" when absent. */
inline std::string show(const std::optional<long long> &v) {
    return v ? std::to_string(*v) : "null";
}

namespace detail {
    template<typename Snapshot>
    void printSnapshot(const Snapshot &snap, std::ostream &os) {
        os << "{";
        bool first = true;
        for (const auto &[k, v]: snap) {
            os << (first ? "" : ", ") << k << "=" << v;
            first = false;
        }
        os << "}\n";
    }
} // namespace detail

/**
 * @brief Runs one parsed command against map.
 *
 * Results go to out. A rejected duplicate, a reversed sub range and an ordered
 * command sent to an unordered map are reported to err; the map is unchanged.
 *
 * @tparam Map LinearHashMap or BpTreeMap keyed and valued by long long.
 */
template<typename Map>
void execute(Map &map, const Command &cmd, std::ostream &out, std::ostream &err) {
    constexpr bool ordered = requires(const Map &m, long long k) { m.subMap(k, k); };
    const auto &a = cmd.args;

    switch (cmd.op) {
        case Op::Put:
            try {
                const std::optional<long long> prev = map.put(a[0], a[1]);
                out << "put " << a[0] << " = " << a[1];
                if (prev) {
                    out << " (was " << *prev << ")";
                }
                out << "\n";
            } catch (const DuplicateKeyError &e) {
                err << "line " << cmd.line << ": " << e.what() << "\n";
            }
            return;
        case Op::Get:
            out << "get " << a[0] << " = " << show(map.get(a[0])) << "\n";
            return;
        case Op::Size:
            out << "size = " << map.size() << "\n";
            return;
        case Op::Print:
            map.print(out);
            return;
        default:
            break;
    }

    if constexpr (ordered) {
        switch (cmd.op) {
            case Op::First:
                out << "first = " << show(map.firstKey()) << "\n";
                return;
            case Op::Last:
                out << "last = " << show(map.lastKey()) << "\n";
                return;
            case Op::Head:
                detail::printSnapshot(map.headMap(a[0]), out);
                return;
            case Op::Tail:
                detail::printSnapshot(map.tailMap(a[0]), out);
                return;
            case Op::Sub:
                if (a[1] < a[0]) {
                    err << "line " << cmd.line << ": sub: fromKey > toKey\n";
                    return;
                }
                detail::printSnapshot(map.subMap(a[0], a[1]), out);
                return;
            default:
                return;
        }
    } else {
        err << "line " << cmd.line << ": " << op_name(cmd.op)
            << " is not supported by the hash map (unordered)\n";
    }
}

/**
 * @brief Parses all of in, then runs every command against map.
 *
 * Nothing is executed when a line is malformed.
 *
 * @return 0 on success, 1 after reporting a ScriptError to err.
 */
template<typename Map>
int runScript(Map &map, std::istream &in, std::ostream &out, std::ostream &err) {
    std::vector<Command> cmds;
    try {
        cmds = parse_script(in);
    } catch (const ScriptError &e) {
        err << "script error: " << e.what() << "\n";
        return 1;
    }
    for (const Command &cmd: cmds) {
        execute(map, cmd, out, err);
    }
    out << "Accesses = " << map.accessCount() << "\n";
    return 0;
}

} // namespace indexmaps::script

#endif // INDEXMAPS_SCRIPT_RUNNER_HPP
