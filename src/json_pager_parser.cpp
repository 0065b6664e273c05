// Value parser: builds the node arena from nlohmann::json SAX events
#include "json_pager_parser.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <istream>
#include <memory>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

static const char *const kNaNPlaceholder = "__JSON_PAGER_NaN__";
static const char *const kInfPlaceholder = "__JSON_PAGER_INF__";
static const char *const kNegInfPlaceholder = "__JSON_PAGER_NEG_INF__";

ParseError::ParseError(std::size_t line, std::size_t column, const std::string &message)
    : std::runtime_error("line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message),
      errorLine(line), errorColumn(column), errorMessage(message)
{
}

NodeIndex TreeSink::append(Node node)
{
    return tree.appendNode(std::move(node));
}

void TreeSink::complete(NodeIndex index)
{
    tree.markComplete(index);
}

// Rewrites unquoted NaN/Infinity literals into placeholder strings so the
// strict JSON lexer accepts them.  Input may be split anywhere: a literal cut
// off at the end of one piece is held back until the next.
class SpecialNumberFilter
{
public:
    void feed(const std::string &piece, std::string &out);

    void finish(std::string &out)
    {
        out += held;
        held.clear();
    }

private:
    std::string held;
    bool inString = false;
    bool escaped = false;
};

struct SpecialNumber
{
    const char *literal;
    const char *placeholder;
};

static const SpecialNumber kSpecialNumbers[] = {
    {"NaN", kNaNPlaceholder},
    {"Infinity", kInfPlaceholder},
    {"-Infinity", kNegInfPlaceholder},
};

void SpecialNumberFilter::feed(const std::string &piece, std::string &out)
{
    std::string input;
    input.swap(held);
    input += piece;
    out.reserve(out.size() + input.size());

    for (std::size_t i = 0; i < input.size();)
    {
        char c = input[i];
        if (inString)
        {
            out.push_back(c);
            ++i;
            if (escaped)
                escaped = false;
            else if (c == '\\')
                escaped = true;
            else if (c == '"')
                inString = false;
            continue;
        }
        if (c == '"')
        {
            inString = true;
            out.push_back(c);
            ++i;
            continue;
        }
        if (c == 'N' || c == 'I' || c == '-')
        {
            bool replaced = false;
            bool cutOff = false;
            for (const SpecialNumber &special : kSpecialNumbers)
            {
                std::size_t length = std::strlen(special.literal);
                std::size_t available = std::min(length, input.size() - i);
                if (input.compare(i, available, special.literal, available) != 0)
                    continue;
                if (available < length)
                {
                    cutOff = true;
                    continue;
                }
                out += '"';
                out += special.placeholder;
                out += '"';
                i += length;
                replaced = true;
                break;
            }
            if (replaced)
                continue;
            if (cutOff)
            {
                held = input.substr(i);
                return;
            }
        }
        out.push_back(c);
        ++i;
    }
}

// Feeds the JSON lexer from a ChunkSource, one piece at a time.  Keeps the
// line and column where the current piece starts so that parser positions
// can be turned into error locations without holding on to the whole input.
class SourceBuffer : public std::streambuf
{
public:
    SourceBuffer(const ChunkSource &source, bool specialNumbers)
        : source(source), specialNumbers(specialNumbers)
    {
    }

    // Line and column of the last character the lexer had read when it was
    // at `position`, both 1-based.
    void locate(std::size_t position, std::size_t &line, std::size_t &column) const
    {
        line = startLine;
        column = startColumn;
        std::size_t end = position > 0 ? position - 1 : 0;
        for (std::size_t i = bufferStart; i < end && i - bufferStart < buffer.size(); ++i)
        {
            if (buffer[i - bufferStart] == '\n')
            {
                ++line;
                column = 1;
            }
            else
            {
                ++column;
            }
        }
    }

protected:
    int_type underflow() override
    {
        if (gptr() < egptr())
            return traits_type::to_int_type(*gptr());
        if (exhausted)
            return traits_type::eof();

        moveStartPast(buffer);
        buffer.clear();
        std::string chunk;
        while (buffer.empty())
        {
            if (!source(chunk))
            {
                exhausted = true;
                if (specialNumbers)
                    filter.finish(buffer);
                break;
            }
            if (specialNumbers)
                filter.feed(chunk, buffer);
            else
                buffer.swap(chunk);
        }

        if (buffer.empty())
        {
            setg(nullptr, nullptr, nullptr);
            return traits_type::eof();
        }
        setg(&buffer[0], &buffer[0], &buffer[0] + buffer.size());
        return traits_type::to_int_type(buffer[0]);
    }

private:
    const ChunkSource &source;
    bool specialNumbers;
    SpecialNumberFilter filter;
    std::string buffer;
    std::size_t bufferStart = 0;
    std::size_t startLine = 1;
    std::size_t startColumn = 1;
    bool exhausted = false;

    void moveStartPast(const std::string &piece)
    {
        for (char c : piece)
        {
            if (c == '\n')
            {
                ++startLine;
                startColumn = 1;
            }
            else
            {
                ++startColumn;
            }
        }
        bufferStart += piece.size();
    }
};

// nlohmann messages look like "[json.exception.parse_error.101] parse error
// at line 1, column 4: syntax error ...".  Keep the part after the location.
static std::string cleanMessage(const std::string &what)
{
    std::size_t pos = what.find("column");
    if (pos != std::string::npos)
    {
        std::size_t colon = what.find(": ", pos);
        if (colon != std::string::npos)
            return what.substr(colon + 2);
    }
    if (!what.empty() && what[0] == '[')
    {
        std::size_t close = what.find("] ");
        if (close != std::string::npos)
            return what.substr(close + 2);
    }
    return what;
}

// SAX handler that turns parser events into arena nodes.  Unlike a DOM
// parser it keeps duplicate keys and the source text of numbers.
class TreeBuilder : public nlohmann::json_sax<json>
{
    using number_integer_t = json::number_integer_t;
    using number_unsigned_t = json::number_unsigned_t;
    using number_float_t = json::number_float_t;
    using string_t = json::string_t;
    using binary_t = json::binary_t;

public:
    TreeBuilder(NodeSink &sink, const ParseOptions &options, const SourceBuffer &input)
        : sink(sink), options(options), input(input)
    {
    }

    bool null() override { return scalar(ValueKind::Null, "null"); }

    bool boolean(bool val) override { return scalar(ValueKind::Bool, val ? "true" : "false"); }

    // The lexer reports non-negative literals as unsigned, so a signed zero
    // was written "-0", the one literal its value does not reproduce.
    bool number_integer(number_integer_t val) override
    {
        if (val == 0)
            return scalar(ValueKind::Number, "-0");
        return scalar(ValueKind::Number, std::to_string(val));
    }

    bool number_unsigned(number_unsigned_t val) override { return scalar(ValueKind::Number, std::to_string(val)); }

    // The lexer hands over the literal exactly as written.
    bool number_float(number_float_t, const string_t &s) override { return scalar(ValueKind::Number, s); }

    bool string(string_t &val) override
    {
        if (options.allowSpecialNumbers)
        {
            if (val == kNaNPlaceholder)
                return scalar(ValueKind::Number, "NaN");
            if (val == kInfPlaceholder)
                return scalar(ValueKind::Number, "Infinity");
            if (val == kNegInfPlaceholder)
                return scalar(ValueKind::Number, "-Infinity");
        }
        return scalar(ValueKind::String, std::move(val));
    }

    // Only produced by binary formats, never by JSON text.
    bool binary(binary_t &) override { return sink.keepGoing(); }

    bool start_object(std::size_t) override { return open(ValueKind::Object); }

    bool key(string_t &val) override
    {
        pendingKey = std::move(val);
        hasPendingKey = true;
        return sink.keepGoing();
    }

    bool end_object() override { return close(); }

    bool start_array(std::size_t) override { return open(ValueKind::Array); }

    bool end_array() override { return close(); }

    bool parse_error(std::size_t position, const std::string &, const nlohmann::detail::exception &ex) override
    {
        failed = true;
        errorPosition = position;
        errorMessage = cleanMessage(ex.what());
        return false;
    }

    bool hasFailed() const { return failed; }

    ParseError error(std::size_t lineOffset) const
    {
        std::size_t line = 0;
        std::size_t column = 0;
        input.locate(errorPosition, line, column);
        return ParseError(line + lineOffset, column, errorMessage);
    }

private:
    NodeSink &sink;
    const ParseOptions &options;
    const SourceBuffer &input;
    std::vector<NodeIndex> openContainers; // containers whose closing delimiter is pending
    std::string pendingKey;
    bool hasPendingKey = false;
    bool failed = false;
    std::size_t errorPosition = 0;
    std::string errorMessage;

    Node makeNode(ValueKind kind)
    {
        Node n;
        n.kind = kind;
        n.parent = openContainers.empty() ? kDocumentRoot : openContainers.back();
        if (hasPendingKey)
        {
            n.key = std::move(pendingKey);
            n.hasKey = true;
            pendingKey.clear();
            hasPendingKey = false;
        }
        return n;
    }

    bool scalar(ValueKind kind, std::string text)
    {
        Node n = makeNode(kind);
        n.text = std::move(text);
        sink.append(std::move(n));
        return sink.keepGoing();
    }

    bool open(ValueKind kind)
    {
        Node n = makeNode(kind);
        n.complete = false;
        int depth = static_cast<int>(openContainers.size());
        n.collapsed = options.initialDepth >= 0 && depth >= options.initialDepth;
        openContainers.push_back(sink.append(std::move(n)));
        return sink.keepGoing();
    }

    bool close()
    {
        if (!openContainers.empty())
        {
            sink.complete(openContainers.back());
            openContainers.pop_back();
        }
        return sink.keepGoing();
    }
};

static bool isBlank(const std::string &s)
{
    return s.find_first_not_of(" \t\r") == std::string::npos;
}

// Hands out `text` once.
static ChunkSource wholeText(const std::string &text)
{
    auto delivered = std::make_shared<bool>(false);
    return [&text, delivered](std::string &chunk) {
        if (*delivered)
            return false;
        chunk = text;
        *delivered = true;
        return true;
    };
}

// Parses one value from `source`.  `lineOffset` is added to error lines.
static bool parseValue(const ChunkSource &source, const ParseOptions &options, NodeSink &sink,
                       std::size_t lineOffset)
{
    SourceBuffer buffer(source, options.allowSpecialNumbers);
    std::istream in(&buffer);
    TreeBuilder builder(sink, options, buffer);
    if (json::sax_parse(in, &builder))
        return true;
    // A source that gives up early looks like truncated input to the lexer.
    if (!sink.keepGoing())
        return false;
    if (builder.hasFailed())
        throw builder.error(lineOffset);
    return false;
}

static bool parseLine(std::string line, std::size_t lineNumber, const ParseOptions &options, NodeSink &sink)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (isBlank(line))
        return sink.keepGoing();
    return parseValue(wholeText(line), options, sink, lineNumber - 1);
}

// Every line is parsed as soon as its newline arrives.
static bool parseLines(const ChunkSource &source, const ParseOptions &options, NodeSink &sink)
{
    std::string pending;
    std::string chunk;
    std::size_t lineNumber = 0;
    while (source(chunk))
    {
        std::size_t start = 0;
        std::size_t searchFrom = pending.size();
        pending += chunk;
        std::size_t end;
        while ((end = pending.find('\n', searchFrom)) != std::string::npos)
        {
            if (!parseLine(pending.substr(start, end - start), ++lineNumber, options, sink))
                return false;
            start = end + 1;
            searchFrom = start;
        }
        pending.erase(0, start);
    }
    if (!sink.keepGoing())
        return false;
    if (!pending.empty())
        return parseLine(pending, ++lineNumber, options, sink);
    return true;
}

bool parseStream(const ChunkSource &source, const ParseOptions &options, NodeSink &sink)
{
    if (options.mode == InputMode::LineDelimited)
        return parseLines(source, options, sink);
    return parseValue(source, options, sink, 0);
}

bool parseToSink(const std::string &contents, const ParseOptions &options, NodeSink &sink)
{
    return parseStream(wholeText(contents), options, sink);
}

void parseInto(ValueTree &tree, const std::string &contents, const ParseOptions &options)
{
    tree.setLineDelimited(options.mode == InputMode::LineDelimited);
    TreeSink sink(tree);
    parseToSink(contents, options, sink);
}

ValueTree parseDocument(const std::string &contents, const ParseOptions &options)
{
    ValueTree tree;
    parseInto(tree, contents, options);
    return tree;
}

std::string replaceSpecialNumbers(const std::string &contents)
{
    SpecialNumberFilter filter;
    std::string processed;
    filter.feed(contents, processed);
    filter.finish(processed);
    return processed;
}
