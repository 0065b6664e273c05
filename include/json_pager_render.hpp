#pragma once

#include "json_pager_flatten.hpp"
#include "json_pager_search.hpp"
#include "json_pager_tree.hpp"

#include <cstddef>
#include <string>
#include <vector>

enum class Style
{
    Plain,
    Punctuation,
    Key,
    String,
    Number,
    Boolean,
    Null,
    Annotation
};

enum class DisplayMode
{
    Data, // unquoted identifier keys, no commas, array indices, size hints
    Json  // exact JSON text
};

struct DisplayOptions
{
    DisplayMode mode = DisplayMode::Json;
    int indentWidth = 2;
};

// Byte range of `RenderedLine::text` drawn in one style.
struct Span
{
    Style style = Style::Plain;
    std::size_t begin = 0;
    std::size_t end = 0;
};

// Byte range of a search match, drawn on top of the syntax spans.
struct Highlight
{
    std::size_t begin = 0;
    std::size_t end = 0;
    bool current = false;
};

struct RenderedLine
{
    std::string text;
    std::vector<Span> spans;
    std::vector<Highlight> highlights;
};

RenderedLine renderLine(const ValueTree &tree, const Line &line, const DisplayOptions &options,
                        const SearchEngine *search = nullptr);

// JSON string escaping without the surrounding quotes.  When `offsets` is
// given it receives, for every input byte, the position of its escaped form
// in the result, plus one trailing entry for the end.
std::string escapeString(const std::string &s, std::vector<std::size_t> *offsets = nullptr);

// True for keys that can be written without quotes (`[A-Za-z_][A-Za-z0-9_]*`).
bool isPlainIdentifier(const std::string &key);

// "3 keys", "1 item"
std::string sizeLabel(const Node &n);

// Pretty-printed JSON of a subtree.  Duplicate keys and number literals
// are written as they were read.
std::string serializeValue(const ValueTree &tree, NodeIndex node, int indentWidth = 2);

// jq-style path of a node relative to its top-level value, e.g.
// `.a.b[2]["odd key"]`.  A top-level value is `.`.
std::string nodePath(const ValueTree &tree, NodeIndex node);
