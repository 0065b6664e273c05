#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

// Key codes fed to the state machine.  Printable keys and control
// characters are their ASCII value; the frontend maps terminal key codes
// for everything else onto the constants below.
namespace Keys
{
    constexpr int Enter = '\n';
    constexpr int Escape = 27;
    constexpr int Space = ' ';
    constexpr int Backspace = 0x10000;
    constexpr int Up = 0x10001;
    constexpr int Down = 0x10002;
    constexpr int Left = 0x10003;
    constexpr int Right = 0x10004;
    constexpr int Home = 0x10005;
    constexpr int End = 0x10006;
    constexpr int PageUp = 0x10007;
    constexpr int PageDown = 0x10008;
    constexpr int F1 = 0x10009;

    constexpr int ctrl(char c) { return c & 0x1f; }
} // namespace Keys

enum class Action
{
    None,
    MoveDown,
    MoveUp,
    MoveToTop,
    MoveToBottom,
    NextSibling,
    PrevSibling,
    CollapseOrParent,
    ExpandOrChild,
    Parent,
    ToggleCollapse,
    Expand,
    Collapse,
    ExpandRecursive,
    CollapseRecursive,
    ExpandAll,
    CollapseAll,
    ScrollDown,
    ScrollUp,
    HalfPageDown,
    HalfPageUp,
    PageDown,
    PageUp,
    CursorToTop,
    CursorToCenter,
    CursorToBottom,
    ScrollLeft,
    ScrollRight,
    ScrollHalfLeft,
    ScrollHalfRight,
    ScrollLeftmost,
    SearchForward,  // starts pattern input
    SearchBackward, // starts pattern input
    Search,         // pattern confirmed with Enter
    NextMatch,
    PrevMatch,
    ClearSearch,
    CopyValue,
    CopyPath,
    Help,
    Quit
};

struct Command
{
    Action action = Action::None;
    long count = 1;
    bool hasCount = false;
    // Set for Action::Search.
    std::string pattern;
    bool forward = true;
};

using Bindings = std::map<std::vector<int>, Action>;

const Bindings &defaultBindings();

// Turns key presses into commands.  Digits accumulate a count, other keys
// extend the pending chord until it names a binding.  A key that neither
// completes nor extends a binding drops all pending input.
class InputStateMachine
{
public:
    static constexpr long kMaxCount = 100000;

    InputStateMachine();
    explicit InputStateMachine(const Bindings &bindings);

    // Returns true when `key` completed a command.
    bool feed(int key, Command &command);
    void reset();

    bool pending() const { return hasCount || !sequence.empty(); }
    // Count and chord typed so far, e.g. "3z".
    std::string pendingText() const;

    bool inSearchInput() const { return searching; }
    const std::string &searchInput() const { return pattern; }
    bool searchForward() const { return forward; }

private:
    Bindings bindings;
    std::set<std::vector<int>> prefixes;
    std::vector<int> sequence;
    long count = 0;
    bool hasCount = false;
    bool searching = false;
    std::string pattern;
    bool forward = true;

    bool feedSearch(int key, Command &command);
};
