// Value tree arena and the visible-line order statistics kept on it
#include "json_pager_tree.hpp"

#include <stdexcept>
#include <utility>

static std::size_t lowBit(std::size_t i)
{
    return i & (~i + 1);
}

void LineCountIndex::clear()
{
    tree.clear();
    sum = 0;
}

// Linear-time construction: every slot pushes its partial sum to the next
// slot responsible for it.
void LineCountIndex::assign(const std::vector<std::size_t> &counts)
{
    const std::size_t n = counts.size();
    tree.assign(n + 1, 0);
    sum = 0;
    for (std::size_t i = 1; i <= n; ++i)
    {
        tree[i] += counts[i - 1];
        sum += counts[i - 1];
        std::size_t up = i + lowBit(i);
        if (up <= n)
        {
            tree[up] += tree[i];
        }
    }
}

void LineCountIndex::pushBack(std::size_t count)
{
    if (tree.empty())
    {
        tree.push_back(0);
    }
    std::size_t i = tree.size();
    // Slot i covers (i - lowbit(i), i]; everything before i is already there.
    std::size_t value = count + prefix(i - 1) - prefix(i - lowBit(i));
    tree.push_back(value);
    sum += count;
}

void LineCountIndex::add(std::size_t pos, long long delta)
{
    if (delta == 0)
    {
        return;
    }
    // Unsigned wrap-around gives the right result for negative deltas as
    // long as the true sums stay non-negative, which they always do.
    const std::size_t step = static_cast<std::size_t>(delta);
    for (std::size_t i = pos + 1; i < tree.size(); i += lowBit(i))
    {
        tree[i] += step;
    }
    sum += step;
}

std::size_t LineCountIndex::prefix(std::size_t count) const
{
    std::size_t result = 0;
    for (std::size_t i = count; i > 0; i -= lowBit(i))
    {
        result += tree[i];
    }
    return result;
}

std::size_t LineCountIndex::find(std::size_t offset, std::size_t &remainder) const
{
    const std::size_t n = size();
    std::size_t step = 1;
    while (step * 2 <= n)
    {
        step *= 2;
    }
    std::size_t pos = 0;
    for (; step > 0 && n > 0; step /= 2)
    {
        if (pos + step <= n && tree[pos + step] <= offset)
        {
            pos += step;
            offset -= tree[pos];
        }
    }
    remainder = offset;
    return pos;
}

ValueTree::ValueTree()
{
    reset();
}

void ValueTree::reset()
{
    nodes.clear();
    Node root;
    root.kind = ValueKind::Array;
    root.depth = -1;
    root.visibleLineCount = 0;
    nodes.push_back(std::move(root));
    isGrowing = false;
    isLineDelimited = false;
}

std::size_t ValueTree::computeCount(const Node &n) const
{
    if (&n == &nodes[kDocumentRoot])
        return n.childLines.total();
    if (!n.isContainer() || n.children.empty() || n.collapsed)
        return 1;
    return 2 + n.childLines.total();
}

// Pushes a change of `index`'s line count up the ancestor chain.  Stops at
// the first ancestor whose own count does not change (a collapsed one).
void ValueTree::propagate(NodeIndex index, long long delta)
{
    NodeIndex cur = index;
    while (delta != 0 && cur != kDocumentRoot)
    {
        const NodeIndex parentIndex = nodes[cur].parent;
        Node &parent = nodes[parentIndex];
        parent.childLines.add(nodes[cur].indexInParent, delta);
        const std::size_t before = parent.visibleLineCount;
        parent.visibleLineCount = computeCount(parent);
        delta = static_cast<long long>(parent.visibleLineCount) - static_cast<long long>(before);
        cur = parentIndex;
    }
}

// Rebuilds counts for the contiguous node range [first, last] bottom-up.
// The arena is in document (pre-)order, so children always come after
// their parent.
void ValueTree::recompute(NodeIndex first, NodeIndex last)
{
    std::vector<std::size_t> counts;
    for (NodeIndex k = last + 1; k-- > first;)
    {
        Node &n = nodes[k];
        if (n.isContainer())
        {
            counts.clear();
            counts.reserve(n.children.size());
            for (NodeIndex child : n.children)
            {
                counts.push_back(nodes[child].visibleLineCount);
            }
            n.childLines.assign(counts);
        }
        n.visibleLineCount = computeCount(n);
    }
}

NodeIndex ValueTree::appendNode(Node node)
{
    const NodeIndex parentIndex = node.parent;
    if (parentIndex >= nodes.size() || !nodes[parentIndex].isContainer())
    {
        throw std::logic_error("appendNode: parent is not a container");
    }
    const NodeIndex index = nodes.size();
    node.children.clear();
    node.childLines.clear();
    node.indexInParent = nodes[parentIndex].children.size();
    node.depth = nodes[parentIndex].depth + 1;
    node.visibleLineCount = 1;
    nodes.push_back(std::move(node));

    Node &parent = nodes[parentIndex];
    parent.children.push_back(index);
    parent.childLines.pushBack(1);
    const std::size_t before = parent.visibleLineCount;
    parent.visibleLineCount = computeCount(parent);
    propagate(parentIndex, static_cast<long long>(parent.visibleLineCount) - static_cast<long long>(before));
    return index;
}

void ValueTree::markComplete(NodeIndex index)
{
    if (index < nodes.size())
    {
        nodes[index].complete = true;
    }
}

bool ValueTree::toggleCollapse(NodeIndex index)
{
    if (index == kDocumentRoot || index >= nodes.size())
        return false;
    return setCollapsed(index, !nodes[index].collapsed);
}

bool ValueTree::setCollapsed(NodeIndex index, bool collapsed)
{
    if (index == kDocumentRoot || index >= nodes.size())
        return false;
    Node &n = nodes[index];
    if (!n.isContainer() || n.children.empty() || n.collapsed == collapsed)
        return false;

    n.collapsed = collapsed;
    const std::size_t before = n.visibleLineCount;
    n.visibleLineCount = computeCount(n);
    propagate(index, static_cast<long long>(n.visibleLineCount) - static_cast<long long>(before));
    return true;
}

void ValueTree::setSubtreeCollapsed(NodeIndex index, bool collapsed)
{
    if (index >= nodes.size())
        return;
    const NodeIndex last = lastDescendant(index);
    for (NodeIndex k = index; k <= last; ++k)
    {
        Node &n = nodes[k];
        if (k != kDocumentRoot && n.isContainer() && !n.children.empty())
        {
            n.collapsed = collapsed;
        }
    }
    const std::size_t before = nodes[index].visibleLineCount;
    recompute(index, last);
    propagate(index, static_cast<long long>(nodes[index].visibleLineCount) - static_cast<long long>(before));
}

void ValueTree::collapseAll(int maxDepth)
{
    for (NodeIndex k = 1; k < nodes.size(); ++k)
    {
        Node &n = nodes[k];
        if (n.isContainer() && !n.children.empty())
        {
            n.collapsed = n.depth >= maxDepth;
        }
    }
    recompute(kDocumentRoot, nodes.size() - 1);
}

void ValueTree::expandAll()
{
    setSubtreeCollapsed(kDocumentRoot, false);
}

bool ValueTree::isVisible(NodeIndex index) const
{
    if (index >= nodes.size())
        return false;
    for (NodeIndex p = nodes[index].parent; p != kNoNode; p = nodes[p].parent)
    {
        if (nodes[p].collapsed)
            return false;
    }
    return true;
}

NodeIndex ValueTree::visibleAncestor(NodeIndex index) const
{
    NodeIndex result = index;
    for (NodeIndex p = nodes[index].parent; p != kNoNode && p != kDocumentRoot; p = nodes[p].parent)
    {
        if (nodes[p].collapsed)
            result = p;
    }
    return result;
}

bool ValueTree::isAncestor(NodeIndex ancestor, NodeIndex index) const
{
    for (NodeIndex p = nodes[index].parent; p != kNoNode; p = nodes[p].parent)
    {
        if (p == ancestor)
            return true;
    }
    return false;
}

NodeIndex ValueTree::lastDescendant(NodeIndex index) const
{
    while (!nodes[index].children.empty())
    {
        index = nodes[index].children.back();
    }
    return index;
}
