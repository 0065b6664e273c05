// Cursor movement, folding and scrolling commands
#include "json_pager_controller.hpp"

#include "json_pager_flatten.hpp"
#include "json_pager_render.hpp"

#include <algorithm>

static bool isExpandedContainer(const Node &n)
{
    return n.isContainer() && !n.children.empty() && !n.collapsed;
}

Controller::Controller(ValueTree &tree) : document(tree)
{
    reset();
}

void Controller::reset()
{
    cursorState = Cursor();
    view.setLineCount(document.visibleLineCount());
    view.scrollTo(0);
    view.setHorizontalOffset(0, contentWidth);
    placeCursor(0);
}

void Controller::placeCursor(std::size_t line)
{
    const std::size_t total = document.visibleLineCount();
    if (total == 0)
    {
        cursorState = Cursor();
        return;
    }
    line = std::min(line, total - 1);
    Line l;
    if (!lineAt(document, line, l))
        return;
    cursorState.line = line;
    cursorState.node = l.node;
    cursorState.onClose = l.role == LineRole::ContainerClose;
}

void Controller::sync()
{
    view.setLineCount(document.visibleLineCount());
    view.keepVisible(cursorState.line);
}

// Re-resolves the cursor line after the collapse state or the tree changed.
// A cursor hidden by a collapsed ancestor moves onto that ancestor.
void Controller::relocate()
{
    if (cursorState.node == kNoNode || cursorState.node >= document.size())
    {
        placeCursor(0);
        sync();
        return;
    }

    NodeIndex target = document.visibleAncestor(cursorState.node);
    std::size_t first = 0;
    std::size_t last = 0;
    if (!lineRangeOf(document, target, first, last))
    {
        placeCursor(0);
        sync();
        return;
    }
    const bool stayOnClose = target == cursorState.node && cursorState.onClose &&
                             isExpandedContainer(document.node(target));
    cursorState.node = target;
    cursorState.onClose = stayOnClose;
    cursorState.line = stayOnClose ? last : first;
    sync();
}

void Controller::treeChanged()
{
    relocate();
}

void Controller::resize(int height, int width)
{
    view.setSize(height, width);
    view.setHorizontalOffset(view.horizontalOffset(), contentWidth);
    sync();
}

void Controller::setScrolloff(int lines)
{
    view.setScrolloff(lines);
    sync();
}

void Controller::setContentWidth(std::size_t width)
{
    contentWidth = width;
    view.setHorizontalOffset(view.horizontalOffset(), contentWidth);
}

void Controller::moveBy(long long delta)
{
    std::size_t line = cursorState.line;
    if (delta < 0)
        line = static_cast<std::size_t>(-delta) > line ? 0 : line - static_cast<std::size_t>(-delta);
    else
        line += static_cast<std::size_t>(delta);
    placeCursor(line);
    sync();
}

void Controller::moveToTop()
{
    placeCursor(0);
    sync();
}

void Controller::moveToBottom()
{
    const std::size_t total = document.visibleLineCount();
    placeCursor(total == 0 ? 0 : total - 1);
    sync();
}

void Controller::moveToLine(std::size_t line)
{
    placeCursor(line);
    sync();
}

bool Controller::moveToSibling(bool next)
{
    if (cursorState.node == kNoNode)
        return false;
    const Node &n = document.node(cursorState.node);
    const Node &parent = document.node(n.parent);
    NodeIndex sibling = kNoNode;
    if (next && n.indexInParent + 1 < parent.children.size())
        sibling = parent.children[n.indexInParent + 1];
    else if (!next && n.indexInParent > 0)
        sibling = parent.children[n.indexInParent - 1];
    if (sibling == kNoNode)
        return false;
    focusNode(sibling);
    return true;
}

bool Controller::moveToParent()
{
    if (cursorState.node == kNoNode)
        return false;
    NodeIndex parent = document.node(cursorState.node).parent;
    if (parent == kDocumentRoot)
        return false;
    focusNode(parent);
    return true;
}

void Controller::collapseOrParent()
{
    if (cursorState.node == kNoNode)
        return;
    if (isExpandedContainer(document.node(cursorState.node)))
        collapseFocused();
    else
        moveToParent();
}

void Controller::expandOrFirstChild()
{
    if (cursorState.node == kNoNode)
        return;
    const Node &n = document.node(cursorState.node);
    if (!n.isContainer() || n.children.empty())
        return;
    if (n.collapsed)
        expandFocused();
    else if (!cursorState.onClose)
        focusNode(n.children.front());
}

bool Controller::toggleFocusedCollapse()
{
    if (cursorState.node == kNoNode)
        return false;
    bool changed = document.toggleCollapse(cursorState.node);
    relocate();
    return changed;
}

bool Controller::expandFocused()
{
    if (cursorState.node == kNoNode)
        return false;
    bool changed = document.setCollapsed(cursorState.node, false);
    relocate();
    return changed;
}

bool Controller::collapseFocused()
{
    if (cursorState.node == kNoNode)
        return false;
    bool changed = document.setCollapsed(cursorState.node, true);
    relocate();
    return changed;
}

void Controller::expandFocusedRecursive()
{
    if (cursorState.node == kNoNode)
        return;
    document.setSubtreeCollapsed(cursorState.node, false);
    relocate();
}

void Controller::collapseFocusedRecursive()
{
    if (cursorState.node == kNoNode)
        return;
    document.setSubtreeCollapsed(cursorState.node, true);
    relocate();
}

bool Controller::expandAll()
{
    if (document.growing())
        return false;
    document.expandAll();
    relocate();
    return true;
}

bool Controller::collapseAll(int depth)
{
    if (document.growing())
        return false;
    document.collapseAll(depth);
    relocate();
    return true;
}

// Scrolls the window and drags the cursor along when it would leave the
// scrolloff band.
void Controller::scrollViewBy(long long delta)
{
    view.scrollBy(delta);
    const std::size_t total = document.visibleLineCount();
    if (total == 0)
        return;
    const std::size_t margin = static_cast<std::size_t>(view.effectiveScrolloff());
    std::size_t low = view.top() + (view.top() > 0 ? margin : 0);
    std::size_t high = view.bottom() - 1;
    if (view.bottom() < total)
        high = high > margin ? high - margin : 0;
    high = std::max(high, view.top());
    low = std::min(low, high);

    if (cursorState.line < low)
        placeCursor(low);
    else if (cursorState.line > high)
        placeCursor(high);
}

void Controller::halfPageDown()
{
    const long long amount = std::max(1, view.height() / 2);
    view.scrollBy(amount);
    moveBy(amount);
}

void Controller::halfPageUp()
{
    const long long amount = std::max(1, view.height() / 2);
    view.scrollBy(-amount);
    moveBy(-amount);
}

void Controller::pageDown()
{
    if (view.bottom() >= document.visibleLineCount())
        moveToBottom();
    else
        scrollViewBy(std::max(1, view.height() - 2));
}

void Controller::pageUp()
{
    if (view.top() == 0)
        moveToTop();
    else
        scrollViewBy(-std::max(1, view.height() - 2));
}

void Controller::focusedLineToTop()
{
    view.placeAtTop(cursorState.line);
}

void Controller::focusedLineToCenter()
{
    view.placeAtCenter(cursorState.line);
}

void Controller::focusedLineToBottom()
{
    view.placeAtBottom(cursorState.line);
}

void Controller::scrollHorizontallyBy(long long delta)
{
    view.scrollHorizontallyBy(delta, contentWidth);
}

void Controller::scrollToLeftmost()
{
    view.setHorizontalOffset(0, contentWidth);
}

void Controller::focusNode(NodeIndex node)
{
    if (node == kDocumentRoot || node >= document.size())
        return;
    for (NodeIndex a = document.node(node).parent; a != kDocumentRoot; a = document.node(a).parent)
    {
        if (document.node(a).collapsed)
            document.setCollapsed(a, false);
    }
    cursorState.node = node;
    cursorState.onClose = false;
    relocate();
}

std::string Controller::focusedValueText(int indentWidth) const
{
    if (cursorState.node == kNoNode)
        return std::string();
    return serializeValue(document, cursorState.node, indentWidth);
}

std::string Controller::focusedPathText() const
{
    if (cursorState.node == kNoNode)
        return std::string();
    return nodePath(document, cursorState.node);
}
