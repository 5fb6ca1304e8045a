#pragma once
#include <string>
#include <fmt/format.h>
#include "FibonacciHeap.h"

// A tree is formatted as its values in pre-order, space-separated: "0 1 2 3"
template <typename T>
struct fmt::formatter<FNode<T>> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') { throw fmt::format_error("invalid format"); }
        return it;
    }
    template <typename FormatContext>
    auto format(const FNode<T>& node, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", fmt::join(node.preorder(), " "));
    }
};

// A heap is formatted one tree per line, the minimum one first:
// Min: 0 1 2 3
// Tree 1: 12 13
// Tree 2: 8 9 10 11
// An empty heap produces no output at all.
template <typename T, typename Comp>
struct fmt::formatter<FibonacciHeap<T, Comp>> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') { throw fmt::format_error("invalid format"); }
        return it;
    }
    template <typename FormatContext>
    auto format(const FibonacciHeap<T, Comp>& fh, FormatContext& ctx) const {
        auto out = ctx.out();
        if (fh.minRoot) {
            out = fmt::format_to(out, "Min: {}\n", *fh.minRoot);
        }
        int idx = 0;
        for (const FNode<T>& tree : fh.roots) {
            out = fmt::format_to(out, "Tree {}: {}\n", ++idx, tree);
        }
        return out;
    }
};

// Debug dump of the heap's internal shape, see the formatter above
template <typename T, typename Comp>
std::string preorder(const FibonacciHeap<T, Comp>& fh) {
    return fmt::format("{}", fh);
}
