#ifndef INDEXMAPS_INDEX_ERRORS_HPP
#define INDEXMAPS_INDEX_ERRORS_HPP

#include "map_concepts.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace indexmaps {

namespace detail {
    /**
     * @brief Best-effort printable form of a key for error messages.
     *
     * @return The streamed key, or "<unprintable>" when Key has no operator<<.
     */
    template<typename T>
    std::string describe(const T &value) {
        if constexpr (Printable<T>) {
            std::ostringstream os;
            os << value;
            return os.str();
        } else {
            return "<unprintable>";
        }
    }
} // namespace detail

/**
 * @brief Thrown by BpTreeMap::put when the key is already present.
 *
 * The tree is left untouched when this is thrown.
 */
class DuplicateKeyError : public std::invalid_argument {
public:
    explicit DuplicateKeyError(std::string key)
        : std::invalid_argument("attempt to insert duplicate key = " + key),
          key_(std::move(key)) {}

    template<typename Key>
    static DuplicateKeyError forKey(const Key &key) {
        return DuplicateKeyError(detail::describe(key));
    }

    /** @brief Printable form of the rejected key. */
    [[nodiscard]] const std::string &key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief A driver script line that could not be parsed.
 */
class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::size_t line, const std::string &what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what),
          line_(line) {}

    [[nodiscard]] std::size_t line() const noexcept {
        return line_;
    }

private:
    std::size_t line_;
};

} // namespace indexmaps

#endif // INDEXMAPS_INDEX_ERRORS_HPP
