/**
 * @file    BpTreeMap.hpp
 * @author  Román Schiffino  (schiffinor)
 * @email   schiffinoroman@gmail.com
 * @version 1.0
 * @brief   Ordered map on a B+Tree with fixed fanout, for point and range queries.
 *
 * ──────────────────────────────────────────────────────────────────────────────
 *  Layout
 *  ──────
 *  Internal nodes hold up to Order-1 separator keys and Order children.  Every
 *  key under child[i] is < key[i] and every key under child[i+1] is >= key[i].
 *  Leaves hold up to Order-1 key/value pairs and a non-owning pointer to the
 *  next leaf, so a range scan is one descent followed by a walk to the right.
 *
 *  Insertion descends to a leaf and wedges the pair in.  A full node splits:
 *  the lower Order/2 entries stay, the rest move to a new right sibling, and
 *  the split travels back up the call stack as a SplitResult.  A split that
 *  gets past the root grows the tree by one level.
 *
 *  Quick-start
 *  ───────────
 *  ```cpp
 *  indexmaps::BpTreeMap<int, int> bpt;
 *  for (int i = 1; i < 10; i += 2) bpt.put(i, i * i);
 *  bpt.firstKey();        // 1
 *  bpt.subMap(3, 8);      // {3:9, 5:25, 7:49}
 *  bpt.put(3, 0);         // throws indexmaps::DuplicateKeyError
 *  ```
 *
 *  headMap/tailMap/subMap return snapshots (std::map copies), not live views.
 *  There is no erase.  Not thread safe.
 * ──────────────────────────────────────────────────────────────────────────────
 */

#ifndef INDEXMAPS_BPTREEMAP_HPP
#define INDEXMAPS_BPTREEMAP_HPP

#pragma once

#include "utils/index_errors.hpp"
#include "utils/map_concepts.hpp"

#include <boost/container/static_vector.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace indexmaps {

/**
 * @brief Sorted key/value map backed by a B+Tree.
 *
 * @tparam Key      Type of the keys, ordered by Compare.
 * @tparam Value    Type of the mapped values.
 * @tparam Compare  Strict weak ordering on Key; defaults to std::less<Key>.
 * @tparam Order    Maximum fanout of a node (children per internal node). At least 3.
 */
template<
    typename Key,
    typename Value,
    typename Compare = std::less<Key>,
    std::size_t Order = 5>
    requires std::strict_weak_order<const Compare &, const Key &, const Key &> &&
             std::copy_constructible<Key> &&
             std::copy_constructible<Value>
class BpTreeMap {
    static_assert(Order >= 3, "a B+Tree node needs a fanout of at least 3");

    static constexpr std::size_t MaxKeys = Order - 1;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Node structure -----

    /**
     * @brief Leaf or internal node.
     *
     * Leaves use values_ and nextLeaf_; internal nodes use children_, which
     * always holds keys_.size() + 1 entries.
     */
    struct Node {
        explicit Node(const bool isLeaf) : isLeaf_(isLeaf) {}

        bool isLeaf_;
        boost::container::static_vector<Key, MaxKeys> keys_;
        boost::container::static_vector<Value, MaxKeys> values_;
        boost::container::static_vector<std::unique_ptr<Node>, Order> children_;
        Node *nextLeaf_ = nullptr; /**< Right sibling in the leaf chain, not owned. */

        [[nodiscard]] bool full() const noexcept {
            return keys_.size() == MaxKeys;
        }
    };

    /**
     * @brief What a split hands to the parent: the routing key and the new right node.
     */
    struct SplitResult {
        Key separator;
        std::unique_ptr<Node> sibling;
    };

    //────────────────────────────────────────────────────────────────────────//
    //----- Internal data members -----

    std::unique_ptr<Node> root_;
    mutable std::size_t count_ = 0; /**< Nodes accessed, for performance testing. */
    Compare comp_;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Key comparison helpers -----

    [[nodiscard]] bool equal_(const Key &a, const Key &b) const {
        return !comp_(a, b) && !comp_(b, a);
    }

    /** @brief Index of the first key >= key. */
    [[nodiscard]] std::size_t lowerBound_(const Node &n, const Key &key) const {
        std::size_t i = 0;
        while (i < n.keys_.size() && comp_(n.keys_[i], key)) {
            ++i;
        }
        return i;
    }

    /** @brief Index of the first key > key, i.e. the child to follow. */
    [[nodiscard]] std::size_t upperBound_(const Node &n, const Key &key) const {
        std::size_t i = 0;
        while (i < n.keys_.size() && !comp_(key, n.keys_[i])) {
            ++i;
        }
        return i;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Descent -----

    /** @brief Leaf whose key range covers key. */
    const Node *leafFor_(const Key &key) const {
        const Node *n = root_.get();
        ++count_;
        while (!n->isLeaf_) {
            n = n->children_[upperBound_(*n, key)].get();
            ++count_;
        }
        return n;
    }

    const Node *leftmostLeaf_() const {
        const Node *n = root_.get();
        ++count_;
        while (!n->isLeaf_) {
            n = n->children_.front().get();
            ++count_;
        }
        return n;
    }

    const Node *rightmostLeaf_() const {
        const Node *n = root_.get();
        ++count_;
        while (!n->isLeaf_) {
            n = n->children_.back().get();
            ++count_;
        }
        return n;
    }

    /** @brief Slot index of key inside its leaf, or nullopt. */
    std::optional<std::pair<const Node *, std::size_t>> locate_(const Key &key) const {
        const Node *leaf = leafFor_(key);
        const std::size_t i = lowerBound_(*leaf, key);
        if (i < leaf->keys_.size() && equal_(leaf->keys_[i], key)) {
            return std::make_pair(leaf, i);
        }
        return std::nullopt;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Wedge and split -----

    /** @brief Insert a pair at position i of a leaf, shifting later entries right. */
    static void wedge_(Node &leaf, const std::size_t i, const Key &key, Value &&value) {
        leaf.keys_.insert(leaf.keys_.begin() + i, key);
        leaf.values_.insert(leaf.values_.begin() + i, std::move(value));
    }

    /** @brief Insert a separator at i and its right child at i + 1 of an internal node. */
    static void wedge_(Node &node, const std::size_t i, SplitResult &&split) {
        node.keys_.insert(node.keys_.begin() + i, std::move(split.separator));
        node.children_.insert(node.children_.begin() + i + 1, std::move(split.sibling));
    }

    /**
     * @brief Split a full leaf while inserting (key, value) at position i.
     *
     * The Order pairs are laid out in order; the first Order/2 stay in leaf and the
     * rest move to a new right sibling, which is spliced into the leaf chain.
     *
     * @return The sibling and its first key as separator.
     */
    static SplitResult splitLeaf_(Node &leaf, const std::size_t i, const Key &key, Value &&value) {
        boost::container::static_vector<Key, Order> keys(
            std::make_move_iterator(leaf.keys_.begin()), std::make_move_iterator(leaf.keys_.end()));
        boost::container::static_vector<Value, Order> values(
            std::make_move_iterator(leaf.values_.begin()), std::make_move_iterator(leaf.values_.end()));
        keys.insert(keys.begin() + i, key);
        values.insert(values.begin() + i, std::move(value));
        leaf.keys_.clear();
        leaf.values_.clear();

        constexpr std::size_t keep = Order / 2;
        auto sibling = std::make_unique<Node>(true);
        for (std::size_t j = 0; j < Order; ++j) {
            Node &dst = j < keep ? leaf : *sibling;
            dst.keys_.push_back(std::move(keys[j]));
            dst.values_.push_back(std::move(values[j]));
        }

        sibling->nextLeaf_ = leaf.nextLeaf_;
        leaf.nextLeaf_ = sibling.get();

        Key separator = sibling->keys_.front();
        return SplitResult{std::move(separator), std::move(sibling)};
    }

    /**
     * @brief Split a full internal node while adding the result of a child split.
     *
     * With the incoming separator there are Order keys and Order + 1 children.
     * The left node keeps keys [0, Order/2) and their children, key Order/2 is
     * promoted to the parent, and the rest go to the new right sibling.
     */
    static SplitResult splitInternal_(Node &node, const std::size_t i, SplitResult &&incoming) {
        boost::container::static_vector<Key, Order> keys(
            std::make_move_iterator(node.keys_.begin()), std::make_move_iterator(node.keys_.end()));
        boost::container::static_vector<std::unique_ptr<Node>, Order + 1> children(
            std::make_move_iterator(node.children_.begin()), std::make_move_iterator(node.children_.end()));
        keys.insert(keys.begin() + i, std::move(incoming.separator));
        children.insert(children.begin() + i + 1, std::move(incoming.sibling));
        node.keys_.clear();
        node.children_.clear();

        constexpr std::size_t mid = Order / 2;
        auto sibling = std::make_unique<Node>(false);
        for (std::size_t j = 0; j < mid; ++j) {
            node.keys_.push_back(std::move(keys[j]));
        }
        for (std::size_t j = 0; j <= mid; ++j) {
            node.children_.push_back(std::move(children[j]));
        }
        for (std::size_t j = mid + 1; j < Order; ++j) {
            sibling->keys_.push_back(std::move(keys[j]));
        }
        for (std::size_t j = mid + 1; j <= Order; ++j) {
            sibling->children_.push_back(std::move(children[j]));
        }
        return SplitResult{std::move(keys[mid]), std::move(sibling)};
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Recursive insertion -----

    /**
     * @brief Insert below n, returning a split for the caller to absorb.
     *
     * Duplicates are detected at the leaf before anything is modified; inserted is
     * then set to false and the tree is unchanged.
     */
    std::optional<SplitResult> insert_(Node &n, const Key &key, Value &value, bool &inserted) {
        ++count_;
        if (n.isLeaf_) {
            const std::size_t i = lowerBound_(n, key);
            if (i < n.keys_.size() && equal_(n.keys_[i], key)) {
                inserted = false;
                return std::nullopt;
            }
            if (!n.full()) {
                wedge_(n, i, key, std::move(value));
                return std::nullopt;
            }
            return splitLeaf_(n, i, key, std::move(value));
        }

        const std::size_t i = upperBound_(n, key);
        std::optional<SplitResult> split = insert_(*n.children_[i], key, value, inserted);
        if (!split) {
            return std::nullopt;
        }
        if (!n.full()) {
            wedge_(n, i, std::move(*split));
            return std::nullopt;
        }
        return splitInternal_(n, i, std::move(*split));
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Range scans -----

    /**
     * @brief Collect pairs from leaf onwards while keys are below toKey.
     *
     * @param fromKey Lower bound (inclusive), or nullptr for none.
     * @param toKey   Upper bound (exclusive), or nullptr for none.
     */
    std::map<Key, Value, Compare> scan_(const Node *leaf, const Key *fromKey, const Key *toKey) const {
        std::map<Key, Value, Compare> out(comp_);
        for (; leaf; leaf = leaf->nextLeaf_) {
            for (std::size_t i = 0; i < leaf->keys_.size(); ++i) {
                const Key &k = leaf->keys_[i];
                if (fromKey && comp_(k, *fromKey)) {
                    continue;
                }
                if (toKey && !comp_(k, *toKey)) {
                    return out;
                }
                out.emplace_hint(out.end(), k, leaf->values_[i]);
            }
            if (leaf->nextLeaf_) {
                ++count_;
            }
        }
        return out;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Validation helpers -----

    /**
     * @brief Check the subtree under n against the bounds [lo, hi).
     * @return Depth of the leaves under n.
     */
    std::size_t validateNode_(const Node &n, const Key *lo, const Key *hi, const bool isRoot,
                              std::vector<const Node *> &leaves) const {
        if (n.keys_.size() > MaxKeys) {
            throw std::runtime_error("Node holds more than Order-1 keys");
        }
        if (!isRoot && n.keys_.empty()) {
            throw std::runtime_error("Non-root node without keys");
        }
        for (std::size_t i = 0; i < n.keys_.size(); ++i) {
            if (i > 0 && !comp_(n.keys_[i - 1], n.keys_[i])) {
                throw std::runtime_error("Keys within a node are not strictly ascending");
            }
            if (lo && comp_(n.keys_[i], *lo)) {
                throw std::runtime_error("Key below its subtree's separator");
            }
            if (hi && !comp_(n.keys_[i], *hi)) {
                throw std::runtime_error("Key not below its subtree's upper separator");
            }
        }

        if (n.isLeaf_) {
            if (n.values_.size() != n.keys_.size()) {
                throw std::runtime_error("Leaf key/value count mismatch");
            }
            if (!n.children_.empty()) {
                throw std::runtime_error("Leaf with children");
            }
            leaves.push_back(&n);
            return 1;
        }

        if (n.children_.size() != n.keys_.size() + 1) {
            throw std::runtime_error("Internal node child count != keys + 1");
        }
        if (!n.values_.empty() || n.nextLeaf_) {
            throw std::runtime_error("Internal node carries leaf data");
        }
        std::size_t depth = 0;
        for (std::size_t i = 0; i < n.children_.size(); ++i) {
            if (!n.children_[i]) {
                throw std::runtime_error("Null child pointer");
            }
            const Key *childLo = i == 0 ? lo : &n.keys_[i - 1];
            const Key *childHi = i == n.keys_.size() ? hi : &n.keys_[i];
            const std::size_t d = validateNode_(*n.children_[i], childLo, childHi, false, leaves);
            if (i == 0) {
                depth = d;
            } else if (d != depth) {
                throw std::runtime_error("Leaves at different depths");
            }
        }
        return depth + 1;
    }

    void printNode_(std::ostream &os, const Node &n, const std::size_t level) const {
        for (std::size_t j = 0; j < level; ++j) {
            os << '\t';
        }
        os << "[ . ";
        for (const Key &k: n.keys_) {
            os << k << " . ";
        }
        os << "]\n";
        if (!n.isLeaf_) {
            for (const auto &child: n.children_) {
                printNode_(os, *child, level + 1);
            }
        }
    }

public:
    using key_type = Key;
    using mapped_type = Value;
    using value_type = std::pair<Key, Value>;
    using size_type = std::size_t;
    using key_compare = Compare;
    using snapshot_type = std::map<Key, Value, Compare>;

    static constexpr std::size_t order = Order;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Constructors and destructors -----

    /**
     * @brief Constructs an empty tree; the root starts out as an empty leaf.
     * @param comp Key ordering (default: Compare{}).
     */
    explicit BpTreeMap(Compare comp = Compare())
        : root_(std::make_unique<Node>(true)),
          comp_(std::move(comp)) {}

    BpTreeMap(const BpTreeMap &) = delete;
    BpTreeMap &operator=(const BpTreeMap &) = delete;

    /**
     * @brief Move constructor: takes over other's nodes; other is left as an empty leaf root.
     *
     * The replacement root is allocated here, so this constructor may throw.
     */
    BpTreeMap(BpTreeMap &&other)
        : BpTreeMap(other.comp_) {
        swap(other);
    }

    /** @brief Move-assignment operator: swaps contents, other gets the prior tree of *this. */
    BpTreeMap &operator=(BpTreeMap &&other) noexcept {
        swap(other);
        return *this;
    }

    ~BpTreeMap() = default;

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Observers -----

    /** @brief The key ordering in use. */
    [[nodiscard]] const Compare &keyComp() const noexcept {
        return comp_;
    }

    /**
     * @brief Total number of keys, counted by walking the leaf chain.
     */
    [[nodiscard]] std::size_t size() const {
        std::size_t sum = 0;
        for (const Node *leaf = leftmostLeaf_(); leaf; leaf = leaf->nextLeaf_) {
            sum += leaf->keys_.size();
        }
        return sum;
    }

    [[nodiscard]] bool empty() const noexcept {
        return root_->isLeaf_ && root_->keys_.empty();
    }

    /** @brief Number of levels; 1 while the root is a leaf. */
    [[nodiscard]] std::size_t height() const noexcept {
        std::size_t h = 1;
        for (const Node *n = root_.get(); !n->isLeaf_; n = n->children_.front().get()) {
            ++h;
        }
        return h;
    }

    /** @brief Nodes visited by lookups, inserts and scans since construction or the last reset. */
    [[nodiscard]] std::size_t accessCount() const noexcept {
        return count_;
    }

    void resetAccessCount() noexcept {
        count_ = 0;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Modifiers -----

    /**
     * @brief Insert a new key/value pair, reporting duplicates by return value.
     * @return false (tree unchanged) if key was already present.
     */
    bool insert(const Key &key, Value value) {
        bool inserted = true;
        std::optional<SplitResult> split = insert_(*root_, key, value, inserted);
        if (split) {
            auto newRoot = std::make_unique<Node>(false);
            newRoot->keys_.push_back(std::move(split->separator));
            newRoot->children_.push_back(std::move(root_));
            newRoot->children_.push_back(std::move(split->sibling));
            root_ = std::move(newRoot);
        }
        return inserted;
    }

    /**
     * @brief Insert a new key/value pair.
     *
     * @return std::nullopt; an existing key is never replaced.
     * @throws DuplicateKeyError if key is already present. The tree is unchanged.
     */
    std::optional<Value> put(const Key &key, Value value) {
        if (!insert(key, std::move(value))) {
            throw DuplicateKeyError::forKey(key);
        }
        return std::nullopt;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Element access -----

    /**
     * @brief Point lookup by root-to-leaf descent.
     * @return A copy of the value, or std::nullopt if key is absent.
     */
    [[nodiscard]] std::optional<Value> get(const Key &key) const {
        if (auto hit = locate_(key)) {
            return hit->first->values_[hit->second];
        }
        return std::nullopt;
    }

    /**
     * @brief In-place access to the value for key; nullptr if absent.
     *
     * The pointer is invalidated by the next insert.
     */
    Value *find(const Key &key) {
        if (auto hit = locate_(key)) {
            return const_cast<Value *>(&hit->first->values_[hit->second]);
        }
        return nullptr;
    }

    const Value *find(const Key &key) const {
        if (auto hit = locate_(key)) {
            return &hit->first->values_[hit->second];
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const Key &key) const {
        return locate_(key).has_value();
    }

    /** @brief Smallest key, or std::nullopt if the tree is empty. */
    [[nodiscard]] std::optional<Key> firstKey() const {
        const Node *leaf = leftmostLeaf_();
        if (leaf->keys_.empty()) {
            return std::nullopt;
        }
        return leaf->keys_.front();
    }

    /** @brief Largest key, or std::nullopt if the tree is empty. */
    [[nodiscard]] std::optional<Key> lastKey() const {
        const Node *leaf = rightmostLeaf_();
        if (leaf->keys_.empty()) {
            return std::nullopt;
        }
        return leaf->keys_.back();
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Range queries -----

    /** @brief Snapshot of all pairs with key < toKey. */
    [[nodiscard]] snapshot_type headMap(const Key &toKey) const {
        return scan_(leftmostLeaf_(), nullptr, &toKey);
    }

    /** @brief Snapshot of all pairs with key >= fromKey. */
    [[nodiscard]] snapshot_type tailMap(const Key &fromKey) const {
        return scan_(leafFor_(fromKey), &fromKey, nullptr);
    }

    /**
     * @brief Snapshot of all pairs with fromKey <= key < toKey.
     * @throws std::invalid_argument if toKey orders before fromKey.
     */
    [[nodiscard]] snapshot_type subMap(const Key &fromKey, const Key &toKey) const {
        if (comp_(toKey, fromKey)) {
            throw std::invalid_argument("subMap: fromKey > toKey");
        }
        return scan_(leafFor_(fromKey), &fromKey, &toKey);
    }

    /**
     * @brief All pairs in ascending key order.
     */
    [[nodiscard]] std::vector<value_type> entries() const {
        std::vector<value_type> out;
        for (const Node *leaf = leftmostLeaf_(); leaf; leaf = leaf->nextLeaf_) {
            for (std::size_t i = 0; i < leaf->keys_.size(); ++i) {
                out.emplace_back(leaf->keys_[i], leaf->values_[i]);
            }
        }
        return out;
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Diagnostics -----

    /**
     * @brief Pre-order dump, one tab of indentation per level.
     */
    void print(std::ostream &os = std::cout) const
        requires Printable<Key>
    {
        os << "BpTreeMap\n";
        os << "-------------------------------------------\n";
        printNode_(os, *root_, 0);
        os << "-------------------------------------------\n";
    }

    /**
     * @brief Validate the tree.
     *
     * Checks key bounds against separators, node occupancy, equal leaf depth, and
     * that the leaf chain visits exactly the in-order leaves with ascending keys.
     * Throws std::runtime_error on any inconsistency.
     */
    void validate() const {
        std::vector<const Node *> leaves;
        validateNode_(*root_, nullptr, nullptr, true, leaves);

        const Node *chained = leaves.front();
        const Key *prev = nullptr;
        for (const Node *expected: leaves) {
            if (chained != expected) {
                throw std::runtime_error("Leaf chain does not follow in-order leaves");
            }
            for (const Key &k: chained->keys_) {
                if (prev && !comp_(*prev, k)) {
                    throw std::runtime_error("Leaf chain keys are not strictly ascending");
                }
                prev = &k;
            }
            chained = chained->nextLeaf_;
        }
        if (chained) {
            throw std::runtime_error("Last leaf links past the end of the tree");
        }
    }

    //───────────────────────────────────────────────────────────────────────────//
    // ----- Swap Functions -----

    void swap(BpTreeMap &other) noexcept {
        using std::swap;
        swap(root_, other.root_);
        swap(count_, other.count_);
        swap(comp_, other.comp_);
    }

    friend void swap(BpTreeMap &a, BpTreeMap &b) noexcept {
        a.swap(b);
    }
};

} // namespace indexmaps

#endif //INDEXMAPS_BPTREEMAP_HPP
