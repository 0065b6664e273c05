#pragma once

#include "json_pager_tree.hpp"
#include "json_pager_viewport.hpp"

#include <cstddef>
#include <string>

// The focused line.  `onClose` is set when the cursor sits on the closing
// row of an expanded container rather than on its opening row.
struct Cursor
{
    std::size_t line = 0;
    NodeIndex node = kNoNode;
    bool onClose = false;
};

// Owns the cursor and viewport over a tree and applies navigation and
// folding commands to them.  After every command the cursor addresses a
// visible line and lies inside the viewport.
class Controller
{
public:
    explicit Controller(ValueTree &tree);

    const ValueTree &tree() const { return document; }
    const Cursor &cursor() const { return cursorState; }
    const Viewport &viewport() const { return view; }

    void reset();
    // Call after nodes were appended to the tree.
    void treeChanged();
    void resize(int height, int width);
    void setScrolloff(int lines);
    // Widest rendered row, bounding horizontal scrolling.
    void setContentWidth(std::size_t width);

    void moveBy(long long delta);
    void moveToTop();
    void moveToBottom();
    void moveToLine(std::size_t line);
    bool moveToSibling(bool next);
    bool moveToParent();
    void collapseOrParent();
    void expandOrFirstChild();

    bool toggleFocusedCollapse();
    bool expandFocused();
    bool collapseFocused();
    void expandFocusedRecursive();
    void collapseFocusedRecursive();
    // Refused while the document is still loading.
    bool expandAll();
    bool collapseAll(int depth);

    void scrollViewBy(long long delta);
    void halfPageDown();
    void halfPageUp();
    void pageDown();
    void pageUp();
    void focusedLineToTop();
    void focusedLineToCenter();
    void focusedLineToBottom();
    void scrollHorizontallyBy(long long delta);
    void scrollToLeftmost();

    // Expands the ancestors of `node` and puts the cursor on its first line.
    void focusNode(NodeIndex node);

    std::string focusedValueText(int indentWidth = 2) const;
    std::string focusedPathText() const;

private:
    ValueTree &document;
    Viewport view;
    Cursor cursorState;
    std::size_t contentWidth = 0;

    void placeCursor(std::size_t line);
    void relocate();
    void sync();
};
