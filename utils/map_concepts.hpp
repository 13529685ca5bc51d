#ifndef INDEXMAPS_MAP_CONCEPTS_HPP
#define INDEXMAPS_MAP_CONCEPTS_HPP

#include <concepts>
#include <cstddef>
#include <ostream>
#include <type_traits>

namespace indexmaps {

/** @brief H hashes a const K & to something usable as a size_t. */
template<typename H, typename K>
concept HashFunctionFor =
        std::regular_invocable<const H &, const K &> &&
        std::convertible_to<std::invoke_result_t<const H &, const K &>, std::size_t>;

/** @brief T can be written to an std::ostream. Needed only by the dump helpers. */
template<typename T>
concept Printable = requires(std::ostream &os, const T &t) { os << t; };

} // namespace indexmaps

#endif // INDEXMAPS_MAP_CONCEPTS_HPP
