// Text and style spans for visible lines, and clipboard serialization
#include "json_pager_render.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <sstream>

using json = nlohmann::json;

static std::string quoted(const std::string &s)
{
    return json(s).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string escapeString(const std::string &s, std::vector<std::size_t> *offsets)
{
    std::string out;
    out.reserve(s.size());
    if (offsets)
    {
        offsets->clear();
        offsets->reserve(s.size() + 1);
    }
    for (char c : s)
    {
        if (offsets)
            offsets->push_back(out.size());
        switch (c)
        {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char buf[7];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            }
            else
            {
                out += c;
            }
        }
    }
    if (offsets)
        offsets->push_back(out.size());
    return out;
}

bool isPlainIdentifier(const std::string &key)
{
    if (key.empty())
        return false;
    for (std::size_t i = 0; i < key.size(); ++i)
    {
        char c = key[i];
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0))
            return false;
    }
    return true;
}

std::string sizeLabel(const Node &n)
{
    std::size_t count = n.children.size();
    if (n.kind == ValueKind::Object)
        return std::to_string(count) + (count == 1 ? " key" : " keys");
    return std::to_string(count) + (count == 1 ? " item" : " items");
}

static void append(RenderedLine &out, Style style, const std::string &text)
{
    if (text.empty())
        return;
    Span span;
    span.style = style;
    span.begin = out.text.size();
    out.text += text;
    span.end = out.text.size();
    out.spans.push_back(span);
}

// Overlays the matches of `node` found in its key or its value.  `base` is
// where the text starts in the line and `offsets` maps unescaped byte
// positions to escaped ones (identity when null).
static void addHighlights(RenderedLine &out, const SearchEngine *search, NodeIndex node, bool inKey,
                          std::size_t base, const std::vector<std::size_t> *offsets)
{
    if (!search || !search->active())
        return;
    std::size_t first = 0;
    std::size_t last = 0;
    search->matchesForNode(node, first, last);
    for (std::size_t i = first; i < last; ++i)
    {
        const SearchMatch &m = search->matches()[i];
        if (m.inKey != inKey)
            continue;
        Highlight h;
        h.begin = base + (offsets ? (*offsets)[m.begin] : m.begin);
        h.end = base + (offsets ? (*offsets)[m.end] : m.end);
        h.current = i == search->currentIndex();
        out.highlights.push_back(h);
    }
}

static void renderKey(RenderedLine &out, const Node &n, NodeIndex index, bool data, const SearchEngine *search)
{
    if (data && isPlainIdentifier(n.key))
    {
        std::size_t base = out.text.size();
        append(out, Style::Key, n.key);
        addHighlights(out, search, index, true, base, nullptr);
    }
    else
    {
        std::vector<std::size_t> offsets;
        std::string escaped = escapeString(n.key, search ? &offsets : nullptr);
        std::size_t base = out.text.size() + 1;
        append(out, Style::Key, "\"" + escaped + "\"");
        addHighlights(out, search, index, true, base, &offsets);
    }
    append(out, Style::Punctuation, ": ");
}

static void renderScalar(RenderedLine &out, const Node &n, NodeIndex index, const SearchEngine *search)
{
    if (n.kind == ValueKind::String)
    {
        std::vector<std::size_t> offsets;
        std::string escaped = escapeString(n.text, search ? &offsets : nullptr);
        std::size_t base = out.text.size() + 1;
        append(out, Style::String, "\"" + escaped + "\"");
        addHighlights(out, search, index, false, base, &offsets);
        return;
    }

    Style style = Style::Null;
    if (n.kind == ValueKind::Number)
        style = Style::Number;
    else if (n.kind == ValueKind::Bool)
        style = Style::Boolean;
    std::size_t base = out.text.size();
    append(out, style, n.text);
    addHighlights(out, search, index, false, base, nullptr);
}

RenderedLine renderLine(const ValueTree &tree, const Line &line, const DisplayOptions &options,
                        const SearchEngine *search)
{
    RenderedLine out;
    const Node &n = tree.node(line.node);
    const bool data = options.mode == DisplayMode::Data;
    const bool object = n.kind == ValueKind::Object;
    out.text.assign(static_cast<std::size_t>(std::max(line.indent, 0) * std::max(options.indentWidth, 0)), ' ');

    if (line.role == LineRole::ContainerClose)
    {
        append(out, Style::Punctuation, object ? "}" : "]");
        if (!n.complete)
            append(out, Style::Annotation, " …");
        else if (line.trailingComma && !data)
            append(out, Style::Punctuation, ",");
        return out;
    }

    if (line.keyed)
    {
        renderKey(out, n, line.node, data, search);
    }
    else if (data && n.parent != kDocumentRoot && tree.node(n.parent).kind == ValueKind::Array)
    {
        append(out, Style::Annotation, "[" + std::to_string(n.indexInParent) + "]");
        append(out, Style::Punctuation, ": ");
    }

    switch (line.role)
    {
    case LineRole::ContainerOpen:
        append(out, Style::Punctuation, object ? "{" : "[");
        break;
    case LineRole::ContainerSummary:
        if (n.children.empty())
        {
            append(out, Style::Punctuation, object ? "{}" : "[]");
        }
        else
        {
            append(out, Style::Punctuation, object ? "{" : "[");
            append(out, Style::Annotation, "...");
            append(out, Style::Punctuation, object ? "}" : "]");
            if (data)
                append(out, Style::Annotation, " (" + sizeLabel(n) + ")");
        }
        break;
    case LineRole::Scalar:
        renderScalar(out, n, line.node, search);
        break;
    case LineRole::ContainerClose:
        break;
    }

    if (line.trailingComma && !data)
        append(out, Style::Punctuation, ",");
    return out;
}

static void writeValue(std::ostringstream &os, const ValueTree &tree, NodeIndex index, int indent, int indentWidth)
{
    const Node &n = tree.node(index);
    switch (n.kind)
    {
    case ValueKind::Object:
    case ValueKind::Array:
    {
        const bool object = n.kind == ValueKind::Object;
        if (n.children.empty())
        {
            os << (object ? "{}" : "[]");
            return;
        }
        os << (object ? "{\n" : "[\n");
        for (std::size_t i = 0; i < n.children.size(); ++i)
        {
            const Node &child = tree.node(n.children[i]);
            os << std::string(indent + indentWidth, ' ');
            if (object)
                os << quoted(child.key) << ": ";
            writeValue(os, tree, n.children[i], indent + indentWidth, indentWidth);
            if (i + 1 < n.children.size())
                os << ",";
            os << "\n";
        }
        os << std::string(indent, ' ') << (object ? "}" : "]");
        break;
    }
    case ValueKind::String:
        os << quoted(n.text);
        break;
    default:
        os << n.text;
        break;
    }
}

std::string serializeValue(const ValueTree &tree, NodeIndex node, int indentWidth)
{
    if (node == kDocumentRoot || node >= tree.size())
        return std::string();
    std::ostringstream os;
    writeValue(os, tree, node, 0, indentWidth);
    return os.str();
}

std::string nodePath(const ValueTree &tree, NodeIndex node)
{
    if (node == kDocumentRoot || node >= tree.size())
        return std::string();

    std::vector<NodeIndex> chain;
    for (NodeIndex cur = node; tree.node(cur).parent != kDocumentRoot; cur = tree.node(cur).parent)
        chain.push_back(cur);
    if (chain.empty())
        return ".";

    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        const Node &n = tree.node(*it);
        if (n.hasKey)
        {
            if (isPlainIdentifier(n.key))
                path += "." + n.key;
            else
                path += "[" + quoted(n.key) + "]";
        }
        else
        {
            path += "[" + std::to_string(n.indexInParent) + "]";
        }
    }
    return path;
}
