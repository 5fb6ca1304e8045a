#pragma once
#include <algorithm>  // std::max
#include <cmath>      // std::ceil, std::log
#include <cstddef>    // size_t
#include <functional> // std::less
#include <iterator>   // std::forward_iterator_tag
#include <numbers>    // std::numbers::phi
#include <optional>
#include <utility>    // std::pair, std::exchange
#include <vector>
#include <fmt/core.h>
#include "DList.h"
#include "vassert.h"

// A heap-ordered multi-way tree. Nodes own their subtrees exclusively and
// have no parent or sibling links - the heap never walks upwards.
template <typename T>
struct FNode {
    using handle = typename DList<FNode>::handle;

    T val;
    DList<FNode> subtrees;

    explicit FNode(const T& val) : val{ val } {}
    explicit FNode(T&& val) : val{ std::move(val) } {}

    // Number of direct children
    int degree() const noexcept { return subtrees.size(); }

    template <typename Comp>
    static bool isSmallerOrEqual(const FNode& lhs, const FNode& rhs, const Comp& comp) {
        return !comp(rhs.val, lhs.val);
    }
    // Links two trees, the one with the smaller root adopting the other.
    // On equal roots the first argument stays on top.
    template <typename Comp>
    static handle merge(handle lhs, handle rhs, const Comp& comp) {
        vassert(lhs && rhs);
        if (isSmallerOrEqual(*lhs, *rhs, comp)) {
            lhs->subtrees.pushBack(std::move(rhs));
            return lhs;
        } else {
            rhs->subtrees.pushBack(std::move(lhs));
            return rhs;
        }
    }
    // Destroys a node, handing out its value and its (now orphaned) subtrees.
    static std::pair<T, DList<FNode>> release(handle node) {
        vassert(node);
        return { std::move(node->val), std::move(node->subtrees) };
    }

    // Pre-order traversal with an explicit stack of sibling ranges, so
    // deep trees don't exhaust the call stack. Each begin() restarts it.
    class preorder_iterator {
        using list_iter = typename DList<FNode>::const_iterator;
        const FNode* curr = nullptr;
        std::vector<std::pair<list_iter, list_iter>> pending; // unvisited siblings, per level
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        preorder_iterator() = default;
        explicit preorder_iterator(const FNode* root) : curr{ root } {}
        const T& operator*() const noexcept { return curr->val; }
        const T* operator->() const noexcept { return &curr->val; }
        preorder_iterator& operator++() {
            if (!curr->subtrees.empty()) {
                pending.emplace_back(curr->subtrees.begin(), curr->subtrees.end());
            }
            curr = nullptr;
            while (!pending.empty()) {
                auto& [it, end] = pending.back();
                if (it == end) {
                    pending.pop_back();
                } else {
                    curr = &*it++;
                    break;
                }
            }
            return *this;
        }
        preorder_iterator operator++(int) { auto copy = *this; ++*this; return copy; }
        // Only the position matters - an exhausted iterator has an empty stack anyway
        bool operator==(const preorder_iterator& other) const noexcept { return curr == other.curr; }
    };
    struct preorder_view {
        const FNode* root;
        preorder_iterator begin() const { return preorder_iterator{ root }; }
        preorder_iterator end() const { return {}; }
    };
    // Values of this tree in pre-order, i.e. a node before its children (in list order)
    preorder_view preorder() const noexcept { return { this }; }
};

template <typename T, typename Comp = std::less<T>>
class FibonacciHeap {
    using Tree = FNode<T>;
    using handle = typename Tree::handle;

    DList<Tree> roots; // All trees except the minimum one
    handle minRoot;    // Empty iff the heap is empty
    size_t numValues = 0;
    [[no_unique_address]] Comp comp = {};

    // The new tree becomes the minimum if it's not larger than the current one,
    // otherwise it just joins the roots list. Ties favor the new tree.
    void promote(handle&& hnd) {
        if (!minRoot) {
            minRoot = std::move(hnd);
        } else if (Tree::isSmallerOrEqual(*hnd, *minRoot, comp)) {
            roots.pushBack(std::exchange(minRoot, std::move(hnd)));
        } else {
            roots.pushBack(std::move(hnd));
        }
    }
public:
    FibonacciHeap() = default;
    explicit FibonacciHeap(const Comp& comp) : comp{ comp } {}
    FibonacciHeap(FibonacciHeap&& other) noexcept
        : roots{ std::move(other.roots) }, minRoot{ std::move(other.minRoot) }
        , numValues{ std::exchange(other.numValues, 0) }, comp{ std::move(other.comp) } {}
    FibonacciHeap& operator=(FibonacciHeap&& other) noexcept {
        if (this != &other) {
            roots = std::move(other.roots);
            minRoot = std::move(other.minRoot);
            numValues = std::exchange(other.numValues, 0);
            comp = std::move(other.comp);
        }
        return *this;
    }

    // Inserts a value into the heap. O(1) time, no consolidation.
    void insert(const T& val) {
        promote(DList<Tree>::make(val));
        ++numValues;
    }
    void insert(T&& val) {
        promote(DList<Tree>::make(std::move(val)));
        ++numValues;
    }
    // Merge another heap into the current & leave it empty. O(1) time.
    void merge(FibonacciHeap&& other) {
        vassert(this != &other);
        if (other.empty()) {
            return;
        } else if (empty()) {
            *this = std::move(other);
            return;
        }
        roots.append(std::move(other.roots));
        if (Tree::isSmallerOrEqual(*other.minRoot, *minRoot, comp)) {
            roots.pushBack(std::exchange(minRoot, std::move(other.minRoot)));
            numValues += std::exchange(other.numValues, 0);
        } else {
            // The other minimum is re-inserted as a fresh singleton,
            // its subtrees (if any) become ordinary roots.
            auto [val, subtrees] = Tree::release(std::move(other.minRoot));
            roots.append(std::move(subtrees));
            insert(std::move(val));
            numValues += std::exchange(other.numValues, 0) - 1;
        }
    }
    // Removes & returns the minimum value in the heap, if any. O(lgn) amortized time.
    std::optional<T> extractMin() {
        if (empty()) {
            return std::nullopt;
        }
        --numValues;
        auto [res, subtrees] = Tree::release(std::move(minRoot));
        // The subtrees keep their shape & degree, they're just roots now
        roots.append(std::move(subtrees));
        if (!empty()) {
            // Any root will do here, consolidation finds the real minimum
            minRoot = roots.popFront();
            consolidate();
        }
        vassert(!empty() || roots.empty());
        return std::optional<T>{ std::move(res) };
    }
    // Links roots of equal degree until all degrees are distinct, then rebuilds
    // the roots list & finds the minimum. Normally only called by extractMin().
    void consolidate() {
        if (empty()) {
            return;
        }
        // No node in an n-element heap has degree over log_phi(n)
        const double maxDegree = std::ceil(std::log(double(numValues)) / std::log(std::numbers::phi));
        std::vector<handle> trees(size_t(maxDegree) + 1);
        roots.pushFront(std::move(minRoot));
        while (!roots.empty()) {
            handle curr = roots.popFront();
            size_t deg = curr->degree();
            vassert(deg < trees.size());
            // Same as adding binary numbers, carrying over to the next degree
            while (trees[deg]) {
                curr = Tree::merge(std::move(curr), std::move(trees[deg]), comp);
                ++deg;
                vassert(deg < trees.size() && curr->degree() == int(deg));
            }
            trees[deg] = std::move(curr);
        }
        // Ascending degree order determines the new roots order
        for (handle& hnd : trees) {
            if (hnd) {
                promote(std::move(hnd));
            }
        }
    }

    // Returns the minimum value in the heap
    const T& peekMin() const noexcept {
        vassert(!empty());
        return minRoot->val;
    }
    // Checks whether the heap is empty
    bool empty() const noexcept { return (numValues == 0); }
    // Returns the # of values in the heap
    size_t size() const noexcept { return numValues; }

    // Largest degree among all roots, the minimum included. For testing.
    int maxRootDegree() const noexcept {
        int res = (minRoot ? minRoot->degree() : 0);
        for (const Tree& t : roots) {
            res = std::max(res, t.degree());
        }
        return res;
    }
    // Checks the heap property of each tree, that the minimum is really the
    // minimum & that the value count is correct. Obviously O(n), use for testing only.
    bool validate() const {
        if (!minRoot) {
            return (numValues == 0 && roots.empty());
        }
        std::vector<const Tree*> stack = { &*minRoot };
        for (const Tree& t : roots) {
            if (!Tree::isSmallerOrEqual(*minRoot, t, comp)) {
                return false;
            }
            stack.push_back(&t);
        }
        size_t count = 0;
        while (!stack.empty()) {
            const Tree* node = stack.back();
            stack.pop_back();
            ++count;
            for (const Tree& child : node->subtrees) {
                if (!Tree::isSmallerOrEqual(*node, child, comp)) {
                    return false;
                }
                stack.push_back(&child);
            }
        }
        return (count == numValues);
    }

    // Pretty-printing
    friend struct fmt::formatter<FibonacciHeap<T, Comp>>;
};
