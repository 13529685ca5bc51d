#include "command_script.hpp"

#include "index_errors.hpp"

#include <boost/regex.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace indexmaps::script {

namespace {
    constexpr std::array<std::pair<const char *, Op>, 9> kOps {{
        {"put", Op::Put},
        {"get", Op::Get},
        {"size", Op::Size},
        {"first", Op::First},
        {"last", Op::Last},
        {"head", Op::Head},
        {"tail", Op::Tail},
        {"sub", Op::Sub},
        {"print", Op::Print},
    }};

    // word, then whatever follows it; the arguments are checked separately
    const boost::regex &command_regex() {
        static const boost::regex re(R"(^\s*([A-Za-z]+)((?:\s+\S+)*)\s*$)");
        return re;
    }

    const boost::regex &number_regex() {
        static const boost::regex re(R"(^[+-]?\d+$)");
        return re;
    }

    const boost::regex &skip_regex() {
        static const boost::regex re(R"(^\s*(#.*)?$)");
        return re;
    }

    long long to_number(const std::string &token, const std::size_t line) {
        if (!boost::regex_match(token, number_regex())) {
            throw ScriptError(line, "not an integer: '" + token + "'");
        }
        try {
            return std::stoll(token);
        } catch (const std::out_of_range &) {
            throw ScriptError(line, "integer out of range: '" + token + "'");
        }
    }
} // namespace

std::size_t arity(const Op op) noexcept {
    switch (op) {
        case Op::Put:
        case Op::Sub:
            return 2;
        case Op::Get:
        case Op::Head:
        case Op::Tail:
            return 1;
        case Op::Size:
        case Op::First:
        case Op::Last:
        case Op::Print:
            return 0;
    }
    return 0;
}

const char *op_name(const Op op) noexcept {
    for (const auto &[name, value]: kOps) {
        if (value == op) {
            return name;
        }
    }
    return "?";
}

int parse_count(const std::string &text) {
    if (!boost::regex_match(text, number_regex())) {
        throw std::invalid_argument("not an integer: '" + text + "'");
    }
    const int n = std::stoi(text);
    if (n <= 0) {
        throw std::invalid_argument("count must be positive, got " + text);
    }
    return n;
}

std::optional<Command> parse_line(const std::string &text, const std::size_t line) {
    if (boost::regex_match(text, skip_regex())) {
        return std::nullopt;
    }

    boost::smatch m;
    if (!boost::regex_match(text, m, command_regex())) {
        throw ScriptError(line, "cannot parse '" + text + "'");
    }

    std::string word = m[1].str();
    std::ranges::transform(word, word.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = std::ranges::find_if(kOps, [&word](const auto &entry) { return word == entry.first; });
    if (it == kOps.end()) {
        throw ScriptError(line, "unknown command '" + word + "'");
    }

    Command cmd {it->second, {}, line};
    const std::string rest = m[2].str();
    const boost::regex ws(R"(\s+)");
    // -1 selects the text between separators
    for (boost::sregex_token_iterator tok(rest.begin(), rest.end(), ws, -1), end; tok != end; ++tok) {
        if (tok->length() == 0) {
            continue;
        }
        cmd.args.push_back(to_number(tok->str(), line));
    }

    if (cmd.args.size() != arity(cmd.op)) {
        throw ScriptError(line, std::string(op_name(cmd.op)) + " takes " + std::to_string(arity(cmd.op))
                                + " argument(s), got " + std::to_string(cmd.args.size()));
    }
    return cmd;
}

std::vector<Command> parse_script(std::istream &in) {
    std::vector<Command> out;
    std::string text;
    std::size_t line = 0;
    while (std::getline(in, text)) {
        ++line;
        if (auto cmd = parse_line(text, line)) {
            out.push_back(std::move(*cmd));
        }
    }
    return out;
}

} // namespace indexmaps::script
