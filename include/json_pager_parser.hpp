#pragma once

#include "json_pager_tree.hpp"

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

// Malformed input.  `line` and `column` are 1-based.
class ParseError : public std::runtime_error
{
public:
    ParseError(std::size_t line, std::size_t column, const std::string &message);

    std::size_t line() const { return errorLine; }
    std::size_t column() const { return errorColumn; }
    const std::string &message() const { return errorMessage; }

private:
    std::size_t errorLine;
    std::size_t errorColumn;
    std::string errorMessage;
};

enum class InputMode
{
    Json,          // a single top-level value
    LineDelimited  // one value per line
};

struct ParseOptions
{
    InputMode mode = InputMode::Json;
    // Accept unquoted NaN, Infinity and -Infinity as numbers.
    bool allowSpecialNumbers = true;
    // Containers at this depth or deeper start collapsed.  Negative means
    // everything starts expanded.
    int initialDepth = -1;
};

// Receives nodes in document order as the parser produces them.
class NodeSink
{
public:
    virtual ~NodeSink() = default;

    // Stores a node and returns the arena index it will have in the tree.
    virtual NodeIndex append(Node node) = 0;
    // The container's closing delimiter has been read.
    virtual void complete(NodeIndex index) = 0;
    // Polled on every parser event.  Returning false stops the parse.
    virtual bool keepGoing() { return true; }
};

// Appends straight into a tree.
class TreeSink : public NodeSink
{
public:
    explicit TreeSink(ValueTree &tree) : tree(tree) {}

    NodeIndex append(Node node) override;
    void complete(NodeIndex index) override;

private:
    ValueTree &tree;
};

// Parses `contents` and hands every node to `sink`.  Throws ParseError on
// malformed input; nodes produced before the error have already been
// delivered.  Returns false if the sink stopped the parse.
bool parseToSink(const std::string &contents, const ParseOptions &options, NodeSink &sink);

// Replaces `chunk` with the next piece of input.  Returns false when there
// is no more, or when the caller has stopped waiting for it.
using ChunkSource = std::function<bool(std::string &chunk)>;

// Parses input as it arrives from `source`.  Nodes reach the sink as soon
// as the parser has read them, and in line-delimited mode every line is
// parsed once its newline arrives.  Errors and early stops behave as in
// parseToSink.
bool parseStream(const ChunkSource &source, const ParseOptions &options, NodeSink &sink);

// Parses into `tree`, which keeps whatever was parsed if ParseError is thrown.
void parseInto(ValueTree &tree, const std::string &contents, const ParseOptions &options);
ValueTree parseDocument(const std::string &contents, const ParseOptions &options = ParseOptions());

// Rewrites unquoted NaN/Infinity literals into placeholder strings that the
// parser turns back into numbers.
std::string replaceSpecialNumbers(const std::string &contents);
