#pragma once

#include "json_pager_tree.hpp"

#include <cstddef>
#include <vector>

enum class LineRole
{
    ContainerOpen,    // `"key": {` of an expanded, non-empty container
    ContainerClose,   // `}` / `]`
    ContainerSummary, // collapsed `{...}` or empty `{}`
    Scalar
};

// One renderable row.  Lines are computed on demand and never stored for
// the whole document.
struct Line
{
    NodeIndex node = kNoNode;
    LineRole role = LineRole::Scalar;
    int indent = 0;
    bool keyed = false;         // member of an object, rendered with its key
    bool trailingComma = false; // followed by a sibling
};

// Returns the line at global visible index `index`.  Runs in
// O(depth * log branching).  Returns false when `index` is past the end.
bool lineAt(const ValueTree &tree, std::size_t index, Line &out);

// Appends the lines [start, end) to `out` using one descent followed by
// constant-time successor steps.
void linesIn(const ValueTree &tree, std::size_t start, std::size_t end, std::vector<Line> &out);

// Successor / predecessor of a line in the current collapse state.
bool nextLine(const ValueTree &tree, const Line &line, Line &out);
bool previousLine(const ValueTree &tree, const Line &line, Line &out);

// First and last global line indices occupied by `node`.  Returns false if
// the node is hidden by a collapsed ancestor.
bool lineRangeOf(const ValueTree &tree, NodeIndex node, std::size_t &first, std::size_t &last);

// The line on which `node` starts (its open, summary or scalar line).
Line firstLineOf(const ValueTree &tree, NodeIndex node);
// The line on which `node` ends (its close line when expanded).
Line lastLineOf(const ValueTree &tree, NodeIndex node);
