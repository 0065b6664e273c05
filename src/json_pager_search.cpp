// Regular expression search over the value tree
#include "json_pager_search.hpp"

#include <re2/re2.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

SearchEngine::SearchEngine() = default;

SearchEngine::~SearchEngine() = default;

void SearchEngine::setPattern(const std::string &pattern, bool caseSensitive)
{
    if (pattern.empty())
    {
        clear();
        return;
    }

    re2::RE2::Options options;
    options.set_case_sensitive(caseSensitive);
    // RE2 would print the error to stderr, which curses owns.
    options.set_log_errors(false);
    std::unique_ptr<re2::RE2> compiled(new re2::RE2(pattern, options));
    if (!compiled->ok())
    {
        spdlog::debug("rejected search pattern '{}': {}", pattern, compiled->error());
        throw InvalidPatternError("Invalid pattern: " + pattern);
    }

    term = pattern;
    sensitive = caseSensitive;
    regex = std::move(compiled);
    found.clear();
    currentMatch = kNoMatch;
    isTruncated = false;
    didWrap = false;
}

void SearchEngine::clear()
{
    term.clear();
    found.clear();
    currentMatch = kNoMatch;
    isTruncated = false;
    didWrap = false;
}

void SearchEngine::setScope(bool keys, bool values)
{
    searchKeys = keys;
    searchValues = values;
}

const SearchMatch *SearchEngine::current() const
{
    if (currentMatch == kNoMatch || currentMatch >= found.size())
        return nullptr;
    return &found[currentMatch];
}

void SearchEngine::scan(const std::string &text, NodeIndex node, bool inKey)
{
    const re2::StringPiece input(text);
    re2::StringPiece hit;
    std::size_t pos = 0;
    while (pos <= text.size() && regex->Match(input, pos, text.size(), re2::RE2::UNANCHORED, &hit, 1))
    {
        std::size_t begin = static_cast<std::size_t>(hit.data() - input.data());
        std::size_t end = begin + hit.size();
        if (hit.empty())
        {
            // Step over the whole UTF-8 sequence.
            pos = end + 1;
            while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80)
                ++pos;
            continue;
        }
        if (found.size() >= kMaxMatches)
        {
            isTruncated = true;
            return;
        }
        SearchMatch match;
        match.node = node;
        match.inKey = inKey;
        match.begin = begin;
        match.end = end;
        found.push_back(match);
        pos = end;
    }
}

// Arena order is document order, so the match list comes out sorted by node.
std::size_t SearchEngine::findAll(const ValueTree &tree)
{
    found.clear();
    currentMatch = kNoMatch;
    isTruncated = false;
    didWrap = false;
    if (!active())
        return 0;

    for (NodeIndex i = 1; i < tree.size() && !isTruncated; ++i)
    {
        const Node &n = tree.node(i);
        if (searchKeys && n.hasKey)
            scan(n.key, i, true);
        if (searchValues && !n.isContainer())
            scan(n.text, i, false);
    }
    spdlog::debug("search '{}' found {} matches", term, found.size());
    return found.size();
}

bool SearchEngine::nextMatch(NodeIndex &node)
{
    didWrap = false;
    if (found.empty())
        return false;
    if (currentMatch == kNoMatch)
    {
        currentMatch = 0;
    }
    else
    {
        currentMatch = (currentMatch + 1) % found.size();
        didWrap = currentMatch == 0;
    }
    node = found[currentMatch].node;
    return true;
}

bool SearchEngine::prevMatch(NodeIndex &node)
{
    didWrap = false;
    if (found.empty())
        return false;
    if (currentMatch == kNoMatch)
    {
        currentMatch = found.size() - 1;
    }
    else
    {
        didWrap = currentMatch == 0;
        currentMatch = (currentMatch + found.size() - 1) % found.size();
    }
    node = found[currentMatch].node;
    return true;
}

bool SearchEngine::matchFrom(NodeIndex node, bool forward, NodeIndex &target)
{
    didWrap = false;
    if (found.empty())
        return false;

    auto byNode = [](const SearchMatch &m, NodeIndex n) { return m.node < n; };
    auto nodeBefore = [](NodeIndex n, const SearchMatch &m) { return n < m.node; };
    if (forward)
    {
        auto it = std::upper_bound(found.begin(), found.end(), node, nodeBefore);
        if (it == found.end())
        {
            didWrap = true;
            it = found.begin();
        }
        currentMatch = static_cast<std::size_t>(it - found.begin());
    }
    else
    {
        auto it = std::lower_bound(found.begin(), found.end(), node, byNode);
        if (it == found.begin())
        {
            didWrap = true;
            currentMatch = found.size() - 1;
        }
        else
        {
            currentMatch = static_cast<std::size_t>(it - found.begin()) - 1;
        }
    }
    target = found[currentMatch].node;
    return true;
}

void SearchEngine::matchesForNode(NodeIndex node, std::size_t &first, std::size_t &last) const
{
    auto byNode = [](const SearchMatch &m, NodeIndex n) { return m.node < n; };
    auto nodeBefore = [](NodeIndex n, const SearchMatch &m) { return n < m.node; };
    first = static_cast<std::size_t>(std::lower_bound(found.begin(), found.end(), node, byNode) - found.begin());
    last = static_cast<std::size_t>(std::upper_bound(found.begin(), found.end(), node, nodeBefore) - found.begin());
}

bool smartCaseSensitive(const std::string &pattern)
{
    for (char c : pattern)
    {
        if (std::isupper(static_cast<unsigned char>(c)))
            return true;
    }
    return false;
}
