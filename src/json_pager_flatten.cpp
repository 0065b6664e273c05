// Lazy flattening of the value tree into visible lines
#include "json_pager_flatten.hpp"

static bool isExpanded(const Node &n)
{
    return n.isContainer() && !n.children.empty() && !n.collapsed;
}

static Line makeLine(const ValueTree &tree, NodeIndex index, LineRole role)
{
    const Node &n = tree.node(index);
    const Node &parent = tree.node(n.parent);
    Line line;
    line.node = index;
    line.role = role;
    line.indent = n.depth;
    line.keyed = n.hasKey && role != LineRole::ContainerClose;
    // Top-level values are separate blocks and never take a comma.
    bool hasNext = n.indexInParent + 1 < parent.children.size();
    line.trailingComma = role != LineRole::ContainerOpen && n.parent != kDocumentRoot && hasNext;
    return line;
}

Line firstLineOf(const ValueTree &tree, NodeIndex node)
{
    const Node &n = tree.node(node);
    if (!n.isContainer())
        return makeLine(tree, node, LineRole::Scalar);
    if (isExpanded(n))
        return makeLine(tree, node, LineRole::ContainerOpen);
    return makeLine(tree, node, LineRole::ContainerSummary);
}

Line lastLineOf(const ValueTree &tree, NodeIndex node)
{
    if (isExpanded(tree.node(node)))
        return makeLine(tree, node, LineRole::ContainerClose);
    return firstLineOf(tree, node);
}

bool lineAt(const ValueTree &tree, std::size_t index, Line &out)
{
    if (index >= tree.visibleLineCount())
        return false;

    NodeIndex cur = kDocumentRoot;
    std::size_t offset = index;
    for (;;)
    {
        const Node &n = tree.node(cur);
        if (cur != kDocumentRoot)
        {
            if (!isExpanded(n))
            {
                out = firstLineOf(tree, cur);
                return true;
            }
            if (offset == 0)
            {
                out = makeLine(tree, cur, LineRole::ContainerOpen);
                return true;
            }
            if (offset == n.visibleLineCount - 1)
            {
                out = makeLine(tree, cur, LineRole::ContainerClose);
                return true;
            }
            offset -= 1; // skip the opening line
        }
        std::size_t remainder = 0;
        std::size_t child = n.childLines.find(offset, remainder);
        cur = n.children[child];
        offset = remainder;
    }
}

bool nextLine(const ValueTree &tree, const Line &line, Line &out)
{
    const NodeIndex index = line.node;
    const Node &n = tree.node(index);
    if (line.role == LineRole::ContainerOpen)
    {
        out = firstLineOf(tree, n.children.front());
        return true;
    }
    const Node &parent = tree.node(n.parent);
    if (n.indexInParent + 1 < parent.children.size())
    {
        out = firstLineOf(tree, parent.children[n.indexInParent + 1]);
        return true;
    }
    if (n.parent == kDocumentRoot)
        return false;
    out = makeLine(tree, n.parent, LineRole::ContainerClose);
    return true;
}

bool previousLine(const ValueTree &tree, const Line &line, Line &out)
{
    const NodeIndex index = line.node;
    const Node &n = tree.node(index);
    if (line.role == LineRole::ContainerClose)
    {
        out = lastLineOf(tree, n.children.back());
        return true;
    }
    const Node &parent = tree.node(n.parent);
    if (n.indexInParent > 0)
    {
        out = lastLineOf(tree, parent.children[n.indexInParent - 1]);
        return true;
    }
    if (n.parent == kDocumentRoot)
        return false;
    out = makeLine(tree, n.parent, LineRole::ContainerOpen);
    return true;
}

void linesIn(const ValueTree &tree, std::size_t start, std::size_t end, std::vector<Line> &out)
{
    if (end > tree.visibleLineCount())
        end = tree.visibleLineCount();
    if (start >= end)
        return;

    Line line;
    if (!lineAt(tree, start, line))
        return;
    out.push_back(line);
    for (std::size_t i = start + 1; i < end; ++i)
    {
        Line next;
        if (!nextLine(tree, line, next))
            break;
        out.push_back(next);
        line = next;
    }
}

bool lineRangeOf(const ValueTree &tree, NodeIndex node, std::size_t &first, std::size_t &last)
{
    if (node == kDocumentRoot || node >= tree.size())
        return false;

    std::size_t index = 0;
    NodeIndex cur = node;
    while (cur != kDocumentRoot)
    {
        const Node &c = tree.node(cur);
        const Node &parent = tree.node(c.parent);
        if (parent.collapsed)
            return false;
        index += parent.childLines.prefix(c.indexInParent);
        if (c.parent != kDocumentRoot)
            index += 1; // the parent's opening line
        cur = c.parent;
    }
    first = index;
    last = index + tree.node(node).visibleLineCount - 1;
    return true;
}
