#pragma once

#include "json_pager_tree.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace re2
{
class RE2;
}

// Raised for a pattern RE2 rejects.
class InvalidPatternError : public std::runtime_error
{
public:
    explicit InvalidPatternError(const std::string &message) : std::runtime_error(message) {}
};

// One occurrence of the pattern.  The byte range refers to the unescaped
// key or scalar text of `node`.
struct SearchMatch
{
    NodeIndex node = kNoNode;
    bool inKey = false;
    std::size_t begin = 0;
    std::size_t end = 0;
};

// Regular expression search over keys and scalar values.  Matches are
// computed from node content only, so collapsing never invalidates them;
// call findAll() again when the content changes.  Patterns use RE2 syntax,
// which runs in time linear in the text, so huge string values are safe.
class SearchEngine
{
public:
    static constexpr std::size_t kNoMatch = static_cast<std::size_t>(-1);
    static constexpr std::size_t kMaxMatches = 1000000;

    SearchEngine();
    ~SearchEngine();

    SearchEngine(const SearchEngine &) = delete;
    SearchEngine &operator=(const SearchEngine &) = delete;

    // Compiles `pattern`.  Throws InvalidPatternError and keeps the previous
    // state if it is malformed.  An empty pattern clears the search.
    void setPattern(const std::string &pattern, bool caseSensitive);
    void clear();

    bool active() const { return !term.empty(); }
    const std::string &pattern() const { return term; }
    bool caseSensitive() const { return sensitive; }

    void setScope(bool keys, bool values);
    bool searchesKeys() const { return searchKeys; }
    bool searchesValues() const { return searchValues; }

    // Direction of the last search command; `n` follows it and `N` goes
    // against it.
    void setForward(bool forward) { searchForward = forward; }
    bool forward() const { return searchForward; }

    // Scans the whole tree in document order.  Returns the number of matches.
    std::size_t findAll(const ValueTree &tree);

    const std::vector<SearchMatch> &matches() const { return found; }
    std::size_t currentIndex() const { return currentMatch; }
    const SearchMatch *current() const;
    // True when the result list was cut off at kMaxMatches.
    bool truncated() const { return isTruncated; }
    // True when the last step went past either end of the list.
    bool wrapped() const { return didWrap; }

    // Circular steps through the match list.  Return false if it is empty.
    bool nextMatch(NodeIndex &node);
    bool prevMatch(NodeIndex &node);

    // Selects the first match after (or before) `node` in document order,
    // wrapping around the ends of the document.
    bool matchFrom(NodeIndex node, bool forward, NodeIndex &target);

    // Range [first, last) of matches belonging to `node`.
    void matchesForNode(NodeIndex node, std::size_t &first, std::size_t &last) const;

private:
    std::string term;
    bool sensitive = false;
    std::unique_ptr<re2::RE2> regex;
    bool searchKeys = true;
    bool searchValues = true;
    bool searchForward = true;
    std::vector<SearchMatch> found;
    std::size_t currentMatch = kNoMatch;
    bool isTruncated = false;
    bool didWrap = false;

    void scan(const std::string &text, NodeIndex node, bool inKey);
};

// Smart-case policy: a pattern is case sensitive iff it contains an
// uppercase letter.
bool smartCaseSensitive(const std::string &pattern);
