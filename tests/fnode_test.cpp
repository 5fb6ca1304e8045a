#include "FibonacciHeapFormat.h"
#include "gtest/gtest.h"

#include <functional>
#include <string>
#include <vector>

namespace {

using Node = FNode<int>;
using handle = Node::handle;
constexpr std::less<int> intLess{};

handle makeNode(int val) { return DList<Node>::make(val); }

std::vector<int> preorderValues(const Node& node) {
  std::vector<int> res;
  for (int x : node.preorder()) {
    res.push_back(x);
  }
  return res;
}

struct Item {
  int key;
  char tag;
};
struct ItemLess {
  bool operator()(const Item& lhs, const Item& rhs) const { return lhs.key < rhs.key; }
};

} // namespace

TEST(FNode, init) {
  handle h = makeNode(1);
  EXPECT_EQ(h->degree(), 0);
  EXPECT_EQ(h->val, 1);
  EXPECT_TRUE(h->subtrees.empty());
}

TEST(FNode, is_smaller_or_equal) {
  handle a = makeNode(0), b = makeNode(1), c = makeNode(0);
  EXPECT_TRUE(Node::isSmallerOrEqual(*a, *b, intLess));
  EXPECT_TRUE(Node::isSmallerOrEqual(*a, *c, intLess));
  EXPECT_FALSE(Node::isSmallerOrEqual(*b, *a, intLess));
}

TEST(FNode, merge_smaller_first) {
  handle merged = Node::merge(makeNode(0), makeNode(1), intLess);
  EXPECT_EQ(merged->val, 0);
  EXPECT_EQ(merged->degree(), 1);
  EXPECT_EQ(merged->subtrees.front().val, 1);
}

TEST(FNode, merge_smaller_second) {
  handle merged = Node::merge(makeNode(1), makeNode(0), intLess);
  EXPECT_EQ(merged->val, 0);
  EXPECT_EQ(merged->degree(), 1);
  EXPECT_EQ(merged->subtrees.front().val, 1);
}

TEST(FNode, merge_tie_keeps_first_on_top) {
  using ItemNode = FNode<Item>;
  ItemNode::handle merged = ItemNode::merge(
      DList<ItemNode>::make(Item{ 1, 'a' }), DList<ItemNode>::make(Item{ 1, 'b' }), ItemLess{});
  EXPECT_EQ(merged->val.tag, 'a');
  EXPECT_EQ(merged->subtrees.front().val.tag, 'b');
}

TEST(FNode, merge_trees_of_equal_degree) {
  handle lhs = Node::merge(makeNode(1), makeNode(0), intLess);
  handle rhs = Node::merge(makeNode(2), makeNode(3), intLess);
  handle merged = Node::merge(std::move(lhs), std::move(rhs), intLess);
  EXPECT_EQ(merged->degree(), 2);
  EXPECT_EQ(fmt::format("{}", *merged), "0 1 2 3");
}

TEST(FNode, release_hands_out_value_and_children) {
  handle root = Node::merge(makeNode(0), makeNode(1), intLess);
  root = Node::merge(std::move(root), Node::merge(makeNode(2), makeNode(3), intLess), intLess);
  auto [val, children] = Node::release(std::move(root));
  EXPECT_FALSE(bool(root));
  EXPECT_EQ(val, 0);
  ASSERT_EQ(children.size(), 2);
  std::vector<std::string> trees;
  for (const Node& child : children) {
    trees.push_back(fmt::format("{}", child));
  }
  EXPECT_EQ(trees, (std::vector<std::string>{ "1", "2 3" }));
}

TEST(FNode, preorder_is_restartable) {
  handle root = Node::merge(makeNode(4), makeNode(5), intLess);
  root = Node::merge(std::move(root), Node::merge(makeNode(6), makeNode(7), intLess), intLess);
  const auto view = root->preorder();
  std::vector<int> first(view.begin(), view.end());
  std::vector<int> second(view.begin(), view.end());
  EXPECT_EQ(first, (std::vector<int>{ 4, 5, 6, 7 }));
  EXPECT_EQ(first, second);
}

TEST(FNode, preorder_of_deep_tree) {
  // Each new smaller node adopts the whole tree, producing a single long path
  constexpr int depth = 10000;
  handle root = makeNode(depth);
  for (int i = depth - 1; i >= 0; --i) {
    root = Node::merge(std::move(root), makeNode(i), intLess);
  }
  EXPECT_EQ(root->val, 0);
  const std::vector<int> res = preorderValues(*root);
  ASSERT_EQ(res.size(), size_t(depth + 1));
  for (int i = 0; i <= depth; ++i) {
    EXPECT_EQ(res[i], i);
  }
}
