#include "json_pager_flatten.hpp"
#include "json_pager_parser.hpp"
#include "json_pager_tree.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

// Node indices of the example document:
//   0 root, 1 {..}, 2 "a": 1, 3 "b": [..], 4..6 the elements of b
static const char *const kExample = R"({"a":1,"b":[1,2,3]})";

static std::vector<std::pair<NodeIndex, LineRole>> flatten(const ValueTree &tree)
{
    std::vector<Line> lines;
    linesIn(tree, 0, tree.visibleLineCount(), lines);
    std::vector<std::pair<NodeIndex, LineRole>> result;
    for (const Line &line : lines)
        result.emplace_back(line.node, line.role);
    return result;
}

static std::vector<std::size_t> allCounts(const ValueTree &tree)
{
    std::vector<std::size_t> counts;
    for (NodeIndex i = 0; i < tree.size(); ++i)
        counts.push_back(tree.visibleLineCount(i));
    return counts;
}

TEST(LineCountIndexTest, PrefixSumsAndLookup)
{
    LineCountIndex index;
    index.assign({1, 4, 1, 2});
    EXPECT_EQ(index.size(), 4u);
    EXPECT_EQ(index.total(), 8u);
    EXPECT_EQ(index.prefix(0), 0u);
    EXPECT_EQ(index.prefix(2), 5u);
    EXPECT_EQ(index.prefix(4), 8u);

    std::size_t remainder = 0;
    EXPECT_EQ(index.find(0, remainder), 0u);
    EXPECT_EQ(remainder, 0u);
    EXPECT_EQ(index.find(3, remainder), 1u);
    EXPECT_EQ(remainder, 2u);
    EXPECT_EQ(index.find(5, remainder), 2u);
    EXPECT_EQ(remainder, 0u);
    EXPECT_EQ(index.find(7, remainder), 3u);
    EXPECT_EQ(remainder, 1u);
}

TEST(LineCountIndexTest, PushBackMatchesAssign)
{
    const std::vector<std::size_t> counts = {3, 1, 1, 7, 2, 1, 1, 5, 9, 1, 2};
    LineCountIndex pushed;
    for (std::size_t c : counts)
        pushed.pushBack(c);
    LineCountIndex assigned;
    assigned.assign(counts);

    ASSERT_EQ(pushed.size(), assigned.size());
    for (std::size_t i = 0; i <= counts.size(); ++i)
        EXPECT_EQ(pushed.prefix(i), assigned.prefix(i)) << "prefix " << i;
}

TEST(LineCountIndexTest, NegativeDeltas)
{
    LineCountIndex index;
    index.assign({5, 5, 5});
    index.add(1, -4);
    EXPECT_EQ(index.total(), 11u);
    EXPECT_EQ(index.prefix(2), 6u);
    std::size_t remainder = 0;
    EXPECT_EQ(index.find(5, remainder), 1u);
    EXPECT_EQ(index.find(6, remainder), 2u);
}

TEST(ValueTreeTest, EmptyTree)
{
    ValueTree tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_EQ(tree.visibleLineCount(), 0u);
    EXPECT_EQ(tree.root().depth, -1);
}

TEST(ValueTreeTest, ExampleLineCounts)
{
    ValueTree tree = parseDocument(kExample);
    ASSERT_EQ(tree.size(), 7u);
    EXPECT_EQ(tree.visibleLineCount(), 8u);

    EXPECT_TRUE(tree.toggleCollapse(3));
    EXPECT_TRUE(tree.node(3).collapsed);
    EXPECT_EQ(tree.visibleLineCount(), 4u);
    EXPECT_EQ(tree.visibleLineCount(1), 4u);
}

TEST(ValueTreeTest, ToggleRoundTripRestoresEverything)
{
    ValueTree tree = parseDocument(R"({"x":{"y":[1,{"z":null}],"w":"s"},"v":[[],[true]]})");
    const auto countsBefore = allCounts(tree);
    const auto linesBefore = flatten(tree);

    for (NodeIndex i = 1; i < tree.size(); ++i)
    {
        if (!tree.toggleCollapse(i))
            continue;
        tree.toggleCollapse(i);
        EXPECT_EQ(allCounts(tree), countsBefore) << "node " << i;
        EXPECT_EQ(flatten(tree), linesBefore) << "node " << i;
    }
}

TEST(ValueTreeTest, EmptyContainerToggleChangesNothing)
{
    ValueTree tree = parseDocument(R"({"a":{"b":[],"c":{}}})");
    const auto before = allCounts(tree);
    EXPECT_FALSE(tree.toggleCollapse(3));
    EXPECT_FALSE(tree.toggleCollapse(4));
    EXPECT_FALSE(tree.node(3).collapsed);
    EXPECT_EQ(allCounts(tree), before);
}

TEST(ValueTreeTest, ScalarsAndRootCannotCollapse)
{
    ValueTree tree = parseDocument(kExample);
    EXPECT_FALSE(tree.toggleCollapse(2));
    EXPECT_FALSE(tree.toggleCollapse(kDocumentRoot));
    EXPECT_FALSE(tree.setCollapsed(3, false));
    EXPECT_EQ(tree.visibleLineCount(), 8u);
}

TEST(ValueTreeTest, VisibleLineCountEqualsFullRange)
{
    ValueTree tree = parseDocument(R"([{"a":[1,2]},{"b":{"c":[3,[4,5]]}},[],6])");
    for (NodeIndex i = 1; i < tree.size(); ++i)
    {
        tree.toggleCollapse(i);
        EXPECT_EQ(flatten(tree).size(), tree.visibleLineCount()) << "after toggling " << i;
    }
}

TEST(ValueTreeTest, CollapseAllByDepth)
{
    ValueTree tree = parseDocument(R"({"a":{"b":{"c":1}},"d":[1]})");
    // 1 root object, 2 a, 3 b, 4 c, 5 d, 6 element
    tree.collapseAll(1);
    EXPECT_FALSE(tree.node(1).collapsed);
    EXPECT_TRUE(tree.node(2).collapsed);
    EXPECT_TRUE(tree.node(3).collapsed);
    EXPECT_TRUE(tree.node(5).collapsed);
    EXPECT_EQ(tree.visibleLineCount(), 4u);

    tree.collapseAll(0);
    EXPECT_EQ(tree.visibleLineCount(), 1u);

    tree.expandAll();
    EXPECT_EQ(tree.visibleLineCount(), 10u);
    EXPECT_EQ(flatten(tree).size(), 10u);
}

TEST(ValueTreeTest, SubtreeCollapse)
{
    ValueTree tree = parseDocument(R"({"a":{"b":{"c":1}},"d":[1]})");
    tree.setSubtreeCollapsed(2, true);
    EXPECT_TRUE(tree.node(2).collapsed);
    EXPECT_TRUE(tree.node(3).collapsed);
    EXPECT_FALSE(tree.node(5).collapsed);
    EXPECT_EQ(tree.visibleLineCount(), 6u);

    // Expanding only the outer one reveals the still collapsed inner one.
    tree.setCollapsed(2, false);
    EXPECT_EQ(tree.visibleLineCount(), 8u);

    tree.setSubtreeCollapsed(2, false);
    EXPECT_EQ(tree.visibleLineCount(), 10u);
}

TEST(ValueTreeTest, AncestorQueries)
{
    ValueTree tree = parseDocument(R"({"a":{"b":{"c":1}},"d":[1]})");
    EXPECT_TRUE(tree.isAncestor(1, 4));
    EXPECT_TRUE(tree.isAncestor(2, 4));
    EXPECT_FALSE(tree.isAncestor(5, 4));
    EXPECT_FALSE(tree.isAncestor(4, 4));
    EXPECT_EQ(tree.lastDescendant(2), 4u);
    EXPECT_EQ(tree.lastDescendant(1), 6u);
    EXPECT_EQ(tree.lastDescendant(4), 4u);

    tree.setCollapsed(3, true);
    tree.setCollapsed(2, true);
    EXPECT_FALSE(tree.isVisible(4));
    EXPECT_FALSE(tree.isVisible(3));
    EXPECT_TRUE(tree.isVisible(2));
    // The outermost collapsed ancestor wins.
    EXPECT_EQ(tree.visibleAncestor(4), 2u);
    EXPECT_EQ(tree.visibleAncestor(6), 6u);
}

TEST(ValueTreeTest, AppendUpdatesCountsIncrementally)
{
    ValueTree tree;
    Node array;
    array.kind = ValueKind::Array;
    array.parent = kDocumentRoot;
    array.complete = false;
    NodeIndex a = tree.appendNode(array);
    EXPECT_EQ(tree.visibleLineCount(), 1u);

    for (int i = 0; i < 3; ++i)
    {
        Node n;
        n.kind = ValueKind::Number;
        n.text = std::to_string(i);
        n.parent = a;
        tree.appendNode(n);
    }
    EXPECT_EQ(tree.visibleLineCount(), 5u);
    EXPECT_EQ(tree.node(4).indexInParent, 2u);
    EXPECT_EQ(tree.node(4).depth, 1);

    tree.setCollapsed(a, true);
    Node late;
    late.kind = ValueKind::Null;
    late.text = "null";
    late.parent = a;
    tree.appendNode(late);
    EXPECT_EQ(tree.visibleLineCount(), 1u);
    tree.setCollapsed(a, false);
    EXPECT_EQ(tree.visibleLineCount(), 6u);

    EXPECT_FALSE(tree.node(a).complete);
    tree.markComplete(a);
    EXPECT_TRUE(tree.node(a).complete);
}

TEST(ValueTreeTest, AppendUnderScalarThrows)
{
    ValueTree tree = parseDocument(kExample);
    Node n;
    n.parent = 2;
    EXPECT_THROW(tree.appendNode(n), std::logic_error);
}
