/**
 * @file    LinearHashMap.hpp
 * @author  Román Schiffino  (schiffinor)
 * @email   schiffinoroman@gmail.com
 * @version 1.0
 * @brief   Hash map built on Linear Hashing: the bucket array grows one chain
 *          per split instead of doubling the whole table at once.
 *
 * ──────────────────────────────────────────────────────────────────────────────
 *  How it works
 *  ────────────
 *  The table starts with `mod1` home chains.  Each chain is a singly linked
 *  list of fixed-size buckets (`Slots` pairs each).  Whenever an insert has to
 *  append an overflow bucket, exactly one chain is split: the one sitting at
 *  the split pointer.  Its pairs are re-placed with the finer modulus
 *  `mod2 = 2 * mod1` into either their old index or `index + mod1`, a new
 *  chain slot is appended and the split pointer moves on.  Once every one of
 *  the `mod1` chains of the generation has been split, both moduli
 *  double and the split pointer wraps to 0.
 *
 *  Lookup therefore needs both moduli:
 *
 *      i = hash % mod1;
 *      if (i < splitPointer) i = hash % mod2;   // chain already split
 *
 *  Quick-start
 *  ───────────
 *  ```cpp
 *  indexmaps::LinearHashMap<int, int> ht(11);
 *  ht.put(3, 9);                 // std::nullopt, new key
 *  ht.put(3, 10);                // returns 9, overwritten
 *  if (auto v = ht.get(3)) { … } // 10
 *  ht.print();                   // bucket dump
 *  ```
 *
 *  Gotchas
 *  ───────
 *  • `size()` is the number of stored keys.  `capacity()` is the slot count of
 *    the home buckets of the current generation, `Slots * (mod1 + split)`.
 *  • Keys are matched with KeyEq.  The cached hash is only a shortcut, two
 *    different keys that hash alike live side by side.
 *  • There is no erase.  The table only ever grows.
 *  • Not thread safe.  Wrap it in a lock if you share it.
 * ──────────────────────────────────────────────────────────────────────────────
 */

#ifndef INDEXMAPS_LINEARHASHMAP_HPP
#define INDEXMAPS_LINEARHASHMAP_HPP

#pragma once

#include "utils/map_concepts.hpp"

#include <boost/container/static_vector.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Branch prediction hints for GCC/Clang (no-op on other compilers)
#if defined(__GNUC__) || defined(__clang__)
# define INDEXMAPS_LIKELY(x)   (__builtin_expect(!!(x), 1))
# define INDEXMAPS_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
# define INDEXMAPS_LIKELY(x)   (x)
# define INDEXMAPS_UNLIKELY(x) (x)
#endif

namespace indexmaps {

/**
 * @brief Unordered key/value map using Linear Hashing with chained fixed-size buckets.
 *
 * Key features:
 *   - Average O(1) put() and get(); the table grows by one chain per split.
 *   - put() overwrites and hands back the previous value.
 *   - Per-instance access counter (buckets visited) for performance testing.
 *   - print() and validate() for inspection.
 *
 * @tparam Key    Type of the keys. Must be hashable by Hash and comparable by KeyEq.
 * @tparam Value  Type of the mapped values.
 * @tparam Hash   Hash functor type; defaults to std::hash<Key>.
 * @tparam KeyEq  Equality predicate type; defaults to std::equal_to<Key>.
 * @tparam Slots  Number of key/value pairs a single bucket holds.
 */
template<
    typename Key,
    typename Value,
    typename Hash = std::hash<Key>,
    typename KeyEq = std::equal_to<Key>,
    std::size_t Slots = 4>
    requires HashFunctionFor<Hash, Key> &&
             std::predicate<const KeyEq &, const Key &, const Key &> &&
             std::copy_constructible<Key> &&
             std::copy_constructible<Value>
class LinearHashMap {
    static_assert(Slots > 0, "a bucket needs at least one slot");

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Bucket structure -----

    /**
     * @brief One stored pair plus its full hash, so splits never rehash keys.
     */
    struct Slot {
        Key key_;
        Value value_;
        std::size_t hash_;
    };

    /**
     * @brief Fixed-capacity bucket, owning the next overflow bucket of its chain.
     *
     * Every bucket of a chain except the last one is full.
     */
    struct Bucket {
        boost::container::static_vector<Slot, Slots> slots_; /**< Occupied slots, in arrival order. */
        std::unique_ptr<Bucket> next_; /**< Overflow bucket; nullptr at the end of the chain. */

        Bucket() = default;
        Bucket(const Bucket &) = delete;
        Bucket &operator=(const Bucket &) = delete;

        // Unlink iteratively so a long chain cannot blow the stack.
        ~Bucket() {
            std::unique_ptr<Bucket> cur = std::move(next_);
            while (cur) {
                cur = std::move(cur->next_);
            }
        }

        [[nodiscard]] bool full() const noexcept {
            return slots_.size() == Slots;
        }
    };

    using Chain = std::unique_ptr<Bucket>;

    //────────────────────────────────────────────────────────────────────────//
    //----- Internal data members -----

    std::vector<Chain> hTable_; /**< Chain heads; size() == mod1_ + splitPointer_. Heads are created lazily. */
    std::size_t mod1_; /**< Modulus of the current generation. */
    std::size_t mod2_; /**< Modulus of the next generation, always 2 * mod1_. */
    std::size_t splitPointer_ = 0; /**< Index of the next chain to split. */
    std::size_t size_ = 0; /**< Number of stored keys. */
    std::size_t splitCount_ = 0; /**< Splits performed since construction. */
    mutable std::size_t count_ = 0; /**< Buckets accessed, for performance testing. */

    Hash hashFunc_;
    KeyEq keyEqFunc_;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Hashing and chain management functions -----

    /**
     * @brief Computes the home chain of a hash under the current split state.
     * @param h Full hash of the key.
     * @return Index into hTable_.
     */
    [[nodiscard]] std::size_t homeIndex_(const std::size_t h) const noexcept {
        const std::size_t i = h % mod1_;
        return i < splitPointer_ ? h % mod2_ : i;
    }

    [[nodiscard]] std::size_t hashOf_(const Key &key) const {
        return static_cast<std::size_t>(hashFunc_(key));
    }

    /**
     * @brief Scans one bucket for a key.
     * @return The matching slot, or nullptr.
     */
    Slot *findSlot_(Bucket &b, const Key &key, const std::size_t h) const {
        for (Slot &s: b.slots_) {
            if (s.hash_ == h && keyEqFunc_(s.key_, key)) {
                return &s;
            }
        }
        return nullptr;
    }

    /**
     * @brief Walks the home chain of key, counting bucket accesses.
     * @return The slot holding key, or nullptr if absent.
     */
    Slot *lookup_(const Key &key) const {
        const std::size_t h = hashOf_(key);
        Bucket *b = hTable_[homeIndex_(h)].get();
        for (; b; b = b->next_.get()) {
            ++count_;
            if (Slot *s = findSlot_(*b, key, h)) {
                return s;
            }
        }
        return nullptr;
    }

    /**
     * @brief Appends a slot to the end of chain idx without any split bookkeeping.
     *
     * Used while redistributing a chain. Adds an overflow bucket when the last one is full.
     */
    void place_(const std::size_t idx, Slot &&slot) {
        Chain &head = hTable_[idx];
        if (!head) {
            head = std::make_unique<Bucket>();
        }
        Bucket *last = head.get();
        while (last->next_) {
            last = last->next_.get();
        }
        if (last->full()) {
            last->next_ = std::make_unique<Bucket>();
            last = last->next_.get();
        }
        last->slots_.push_back(std::move(slot));
    }

    /**
     * @brief Splits the chain at the split pointer and advances the split state.
     *
     * The chain is detached, a new chain slot is appended at splitPointer_ + mod1_,
     * and each pair goes to hash % mod2_, which is one of those two indices.
     * When the split pointer reaches mod1_ the generation ends and both moduli double.
     */
    void splitNext_() {
        const std::size_t from = splitPointer_;
        Chain old = std::move(hTable_[from]);
        hTable_.emplace_back(); // index from + mod1_

        for (Bucket *b = old.get(); b; b = b->next_.get()) {
            for (Slot &s: b->slots_) {
                place_(s.hash_ % mod2_, std::move(s));
            }
        }

        ++splitCount_;
        if (INDEXMAPS_UNLIKELY(++splitPointer_ == mod1_)) {
            mod1_ = mod2_;
            mod2_ *= 2;
            splitPointer_ = 0;
        }
    }

public:
    using key_type = Key;
    using mapped_type = Value;
    using value_type = std::pair<Key, Value>;
    using size_type = std::size_t;
    using hasher = Hash;
    using key_equal = KeyEq;

    static constexpr std::size_t slots_per_bucket = Slots;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Constructors and destructors -----

    /**
     * @brief Constructs an empty table with initSize home chains.
     *
     * @param initSize   Initial number of home chains (mod1). Need not be a power of two.
     * @param hashFunc   Hash functor (default: Hash{}).
     * @param keyEqFunc  Key equality predicate (default: KeyEq{}).
     * @throws std::invalid_argument if initSize is 0.
     */
    explicit LinearHashMap(
        const std::size_t initSize = 4,
        Hash hashFunc = Hash(),
        KeyEq keyEqFunc = KeyEq()
    )
        : mod1_(initSize),
          mod2_(2 * initSize),
          hashFunc_(std::move(hashFunc)),
          keyEqFunc_(std::move(keyEqFunc)) {
        if (initSize == 0) {
            throw std::invalid_argument("LinearHashMap needs at least one home bucket");
        }
        hTable_.resize(mod1_);
    }

    LinearHashMap(const LinearHashMap &) = delete;
    LinearHashMap &operator=(const LinearHashMap &) = delete;

    /**
     * @brief Move constructor: takes over other's chains, split state and functors.
     *
     * other is left empty but usable, with a fresh table of its former mod1 home
     * chains. That table is allocated here, so this constructor may throw.
     *
     * @param other Map to move from.
     */
    LinearHashMap(LinearHashMap &&other)
        : LinearHashMap(other.mod1_, other.hashFunc_, other.keyEqFunc_) {
        swap(other);
    }

    /**
     * @brief Move-assignment operator: swaps this map's contents with other.
     *
     * Leaves other with the prior contents of *this.
     */
    LinearHashMap &operator=(LinearHashMap &&other) noexcept {
        swap(other);
        return *this;
    }

    ~LinearHashMap() = default;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Observers -----

    /** @brief Number of stored keys. */
    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size_ == 0;
    }

    /**
     * @brief Slot capacity of the current generation's home buckets.
     *
     * @return Slots * (mod1 + splitPointer). Overflow buckets are not counted.
     */
    [[nodiscard]] std::size_t capacity() const noexcept {
        return Slots * (mod1_ + splitPointer_);
    }

    /** @brief Number of addressable chains, mod1 + splitPointer. */
    [[nodiscard]] std::size_t bucketCount() const noexcept {
        return hTable_.size();
    }

    [[nodiscard]] std::size_t mod1() const noexcept {
        return mod1_;
    }

    [[nodiscard]] std::size_t mod2() const noexcept {
        return mod2_;
    }

    [[nodiscard]] std::size_t splitPointer() const noexcept {
        return splitPointer_;
    }

    [[nodiscard]] std::size_t splitCount() const noexcept {
        return splitCount_;
    }

    /**
     * @brief Number of buckets (home plus overflow) in chain idx.
     * @param idx Zero-based chain index.
     * @throws std::out_of_range if idx is not a valid chain.
     */
    [[nodiscard]] std::size_t chainLength(const std::size_t idx) const {
        if (idx >= hTable_.size()) {
            throw std::out_of_range("Bucket index out of range");
        }
        std::size_t n = 0;
        for (const Bucket *b = hTable_[idx].get(); b; b = b->next_.get()) {
            ++n;
        }
        return n;
    }

    /**
     * @brief Home chain index of key under the current split state.
     */
    [[nodiscard]] std::size_t homeIndex(const Key &key) const {
        return homeIndex_(hashOf_(key));
    }

    /** @brief Buckets visited by put()/get()/find() since construction or the last reset. */
    [[nodiscard]] std::size_t accessCount() const noexcept {
        return count_;
    }

    void resetAccessCount() noexcept {
        count_ = 0;
    }

    [[nodiscard]] const Hash &hashFunction() const noexcept {
        return hashFunc_;
    }

    [[nodiscard]] const KeyEq &keyEqFunction() const noexcept {
        return keyEqFunc_;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Modifiers -----

    /**
     * @brief Insert or overwrite a key/value pair.
     *
     * Walks the home chain; an equal key is overwritten in place. Otherwise the
     * pair goes into the first free slot of the last bucket. If that bucket is
     * full an overflow bucket is appended and one chain split is triggered.
     *
     * @param key   Key to insert.
     * @param value Value to associate.
     * @return The previous value if key was present, std::nullopt otherwise.
     */
    std::optional<Value> put(const Key &key, Value value) {
        const std::size_t h = hashOf_(key);
        Chain &head = hTable_[homeIndex_(h)];
        if (!head) {
            head = std::make_unique<Bucket>();
        }

        Bucket *last = nullptr;
        for (Bucket *b = head.get(); b; b = b->next_.get()) {
            ++count_;
            if (Slot *s = findSlot_(*b, key, h)) {
                return std::exchange(s->value_, std::move(value));
            }
            last = b;
        }

        if (INDEXMAPS_LIKELY(!last->full())) {
            last->slots_.push_back(Slot{key, std::move(value), h});
            ++size_;
            return std::nullopt;
        }

        last->next_ = std::make_unique<Bucket>();
        ++count_;
        last->next_->slots_.push_back(Slot{key, std::move(value), h});
        ++size_;
        splitNext_();
        return std::nullopt;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Element access -----

    /**
     * @brief Look up the value stored for key.
     * @return A copy of the value, or std::nullopt if key is absent.
     */
    [[nodiscard]] std::optional<Value> get(const Key &key) const {
        if (const Slot *s = lookup_(key)) {
            return s->value_;
        }
        return std::nullopt;
    }

    /**
     * @brief In-place access to the value stored for key.
     * @return Pointer to the value, nullptr if key is absent. Invalidated by the next put().
     */
    Value *find(const Key &key) {
        Slot *s = lookup_(key);
        return s ? &s->value_ : nullptr;
    }

    const Value *find(const Key &key) const {
        const Slot *s = lookup_(key);
        return s ? &s->value_ : nullptr;
    }

    [[nodiscard]] bool contains(const Key &key) const {
        return lookup_(key) != nullptr;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Traversal -----

    /**
     * @brief Visit every pair, chain by chain. Order is unspecified.
     * @param f Callable taking (const Key &, const Value &).
     */
    template<class F>
        requires std::invocable<F &, const Key &, const Value &>
    void forEach(F &&f) const {
        for (const Chain &head: hTable_) {
            for (const Bucket *b = head.get(); b; b = b->next_.get()) {
                for (const Slot &s: b->slots_) {
                    f(s.key_, s.value_);
                }
            }
        }
    }

    /**
     * @brief Snapshot of all pairs. Order is unspecified.
     */
    [[nodiscard]] std::vector<value_type> entries() const {
        std::vector<value_type> out;
        out.reserve(size_);
        forEach([&out](const Key &k, const Value &v) { out.emplace_back(k, v); });
        return out;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Diagnostics -----

    /**
     * @brief Dump every chain with its pairs.
     *
     * @param os  Output stream (defaults to std::cout).
     */
    void print(std::ostream &os = std::cout) const
        requires Printable<Key> && Printable<Value>
    {
        os << "Hash Table (Linear Hashing)\n";
        os << "-------------------------------------------\n";
        os << "mod1=" << mod1_ << " mod2=" << mod2_ << " split=" << splitPointer_
           << " keys=" << size_ << "\n";
        for (std::size_t i = 0; i < hTable_.size(); ++i) {
            os << "**** BUCKET " << i << " ****\n";
            for (const Bucket *b = hTable_[i].get(); b; b = b->next_.get()) {
                for (const Slot &s: b->slots_) {
                    os << " | key=" << s.key_ << ", value=" << s.value_;
                }
                os << " |";
                if (b->next_) {
                    os << " ->";
                }
            }
            os << "\n";
        }
        os << "-------------------------------------------\n";
    }

    /**
     * @brief Debug helper: print a key's raw hash and home chain.
     *
     * @param k   Key to hash.
     * @param os  Output stream (defaults to std::cout).
     */
    void debugKey(const Key &k, std::ostream &os = std::cout) const
        requires Printable<Key>
    {
        const std::size_t h = hashOf_(k);
        os << "key=" << k
                << "  hash=" << h
                << "  low=" << h % mod1_
                << "  high=" << h % mod2_
                << "  home=" << homeIndex_(h) << "\n";
    }

    /**
     * @brief Validate internal consistency of the table.
     *
     * Checks the split bookkeeping, that every pair sits in its home chain under the
     * dual-modulus rule, that no key appears twice, that only the last bucket of a
     * chain may be partially filled, and that the key count matches size().
     * Throws std::runtime_error on any inconsistency.
     */
    void validate() const {
        if (mod2_ != 2 * mod1_) {
            throw std::runtime_error("mod2 must be twice mod1");
        }
        if (splitPointer_ >= mod1_) {
            throw std::runtime_error("Split pointer past the end of the generation");
        }
        if (hTable_.size() != mod1_ + splitPointer_) {
            throw std::runtime_error("Chain count != mod1 + splitPointer");
        }

        std::size_t counted = 0;
        for (std::size_t i = 0; i < hTable_.size(); ++i) {
            std::vector<const Slot *> seen;
            for (const Bucket *b = hTable_[i].get(); b; b = b->next_.get()) {
                if (b->next_ && !b->full()) {
                    throw std::runtime_error("Chain " + std::to_string(i) + " has a partially filled bucket before its last one");
                }
                for (const Slot &s: b->slots_) {
                    if (s.hash_ != hashOf_(s.key_)) {
                        throw std::runtime_error("Stale cached hash in bucket " + std::to_string(i));
                    }
                    if (homeIndex_(s.hash_) != i) {
                        throw std::runtime_error("Key stored outside its home bucket " + std::to_string(i));
                    }
                    for (const Slot *other: seen) {
                        if (keyEqFunc_(other->key_, s.key_)) {
                            throw std::runtime_error("Key appears twice in bucket " + std::to_string(i));
                        }
                    }
                    seen.push_back(&s);
                    ++counted;
                }
            }
        }
        if (counted != size_) {
            throw std::runtime_error("Stored pair count != size()");
        }
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Swap Functions -----

    void swap(LinearHashMap &other) noexcept {
        using std::swap;
        swap(hTable_, other.hTable_);
        swap(mod1_, other.mod1_);
        swap(mod2_, other.mod2_);
        swap(splitPointer_, other.splitPointer_);
        swap(size_, other.size_);
        swap(splitCount_, other.splitCount_);
        swap(count_, other.count_);
        swap(hashFunc_, other.hashFunc_);
        swap(keyEqFunc_, other.keyEqFunc_);
    }

    friend void swap(LinearHashMap &a, LinearHashMap &b) noexcept {
        a.swap(b);
    }
};

} // namespace indexmaps

#endif //INDEXMAPS_LINEARHASHMAP_HPP
