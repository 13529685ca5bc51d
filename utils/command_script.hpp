#ifndef INDEXMAPS_COMMAND_SCRIPT_HPP
#define INDEXMAPS_COMMAND_SCRIPT_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace indexmaps::script {

enum class Op {
    Put,   // put <key> <value>
    Get,   // get <key>
    Size,  // size
    First, // first
    Last,  // last
    Head,  // head <toKey>
    Tail,  // tail <fromKey>
    Sub,   // sub <fromKey> <toKey>
    Print, // print
};

struct Command {
    Op op;
    std::vector<long long> args;
    std::size_t line {0};
};

/**
 * @brief Parses one driver line.
 *
 * Blank lines and lines starting with '#' yield std::nullopt. Commands are
 * case-insensitive; numbers are signed decimal and must fit a long long.
 *
 * @throws ScriptError on an unknown command, wrong arity, or a bad number.
 */
std::optional<Command> parse_line(const std::string &text, std::size_t line);

/**
 * @brief Parses every line of in. Stops at the first malformed line by throwing ScriptError.
 */
std::vector<Command> parse_script(std::istream &in);

/**
 * @brief Parses a positive count such as the driver's nKeys argument.
 *
 * The whole text must be a decimal integer; "5x" is rejected.
 *
 * @throws std::invalid_argument if text is not an integer or not positive.
 * @throws std::out_of_range if it does not fit an int.
 */
int parse_count(const std::string &text);

/**
 * @brief Number of numeric arguments op takes.
 */
std::size_t arity(Op op) noexcept;

const char *op_name(Op op) noexcept;

} // namespace indexmaps::script

#endif // INDEXMAPS_COMMAND_SCRIPT_HPP
