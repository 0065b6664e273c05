#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Arena index of a node.  Index 0 is always the hidden document root.
using NodeIndex = std::size_t;

constexpr NodeIndex kNoNode = static_cast<NodeIndex>(-1);
constexpr NodeIndex kDocumentRoot = 0;

enum class ValueKind
{
    Null,
    Bool,
    Number,
    String,
    Object,
    Array
};

// Prefix sums over the visible line counts of a container's children.
// Implemented as a Fenwick tree so a single child's count can change in
// O(log n) and the child covering a given line offset can be found in
// O(log n).  Every child contributes at least one line.
class LineCountIndex
{
public:
    void clear();
    void assign(const std::vector<std::size_t> &counts);
    void pushBack(std::size_t count);
    void add(std::size_t pos, long long delta);

    // Sum of the first `count` entries.
    std::size_t prefix(std::size_t count) const;
    std::size_t total() const { return sum; }
    std::size_t size() const { return tree.empty() ? 0 : tree.size() - 1; }

    // Finds the entry containing `offset` (which must be < total()).  On
    // return `remainder` holds the offset relative to that entry's start.
    std::size_t find(std::size_t offset, std::size_t &remainder) const;

private:
    std::vector<std::size_t> tree; // 1-based, tree[0] unused
    std::size_t sum = 0;
};

struct Node
{
    ValueKind kind = ValueKind::Null;
    std::string key;  // object member name (unescaped)
    bool hasKey = false;
    std::string text; // scalar text: number literal, unescaped string, true/false/null
    NodeIndex parent = kNoNode;
    std::size_t indexInParent = 0;
    int depth = 0;    // top-level values are at depth 0, the document root at -1
    std::vector<NodeIndex> children;
    bool collapsed = false;
    bool complete = true; // closing delimiter seen
    std::size_t visibleLineCount = 1;
    LineCountIndex childLines;

    bool isContainer() const { return kind == ValueKind::Object || kind == ValueKind::Array; }
};

// The parsed document.  Value content is immutable once a node has been
// appended; only collapse flags and the derived line counts change, and
// those only through the methods below.
class ValueTree
{
public:
    ValueTree();

    void reset();

    std::size_t size() const { return nodes.size(); }
    const Node &node(NodeIndex index) const { return nodes[index]; }
    const Node &root() const { return nodes[kDocumentRoot]; }

    // Number of top-level values (children of the document root).
    std::size_t topLevelCount() const { return nodes[kDocumentRoot].children.size(); }
    bool empty() const { return topLevelCount() == 0; }

    // Total number of renderable rows in the current collapse state.
    std::size_t visibleLineCount() const { return nodes[kDocumentRoot].visibleLineCount; }
    std::size_t visibleLineCount(NodeIndex index) const { return nodes[index].visibleLineCount; }

    // True while a background parse is still appending nodes.
    bool growing() const { return isGrowing; }
    void setGrowing(bool value) { isGrowing = value; }

    // Set when the document was read in line-delimited mode.
    bool lineDelimited() const { return isLineDelimited; }
    void setLineDelimited(bool value) { isLineDelimited = value; }

    // Appends a node whose `parent` field names an existing container.  The
    // node is linked as the parent's last child and all counts are updated
    // incrementally.  Returns the new node's index.
    NodeIndex appendNode(Node node);
    void markComplete(NodeIndex index);

    // Flips a container's collapsed flag.  Returns false (and changes
    // nothing) for scalars, empty containers and the document root.
    bool toggleCollapse(NodeIndex index);
    bool setCollapsed(NodeIndex index, bool collapsed);

    // Sets the flag of every non-empty container in the subtree rooted at
    // `index` (including `index` itself) and recomputes counts once.
    void setSubtreeCollapsed(NodeIndex index, bool collapsed);

    // Containers at depth >= maxDepth are collapsed, shallower ones expanded.
    void collapseAll(int maxDepth);
    void expandAll();

    bool isVisible(NodeIndex index) const;
    // The node itself when visible, otherwise its outermost collapsed ancestor.
    NodeIndex visibleAncestor(NodeIndex index) const;
    bool isAncestor(NodeIndex ancestor, NodeIndex index) const;
    // Last node (in document order) of the subtree rooted at `index`.
    NodeIndex lastDescendant(NodeIndex index) const;

private:
    std::vector<Node> nodes;
    bool isGrowing = false;
    bool isLineDelimited = false;

    std::size_t computeCount(const Node &n) const;
    void propagate(NodeIndex index, long long delta);
    void recompute(NodeIndex first, NodeIndex last);
};
