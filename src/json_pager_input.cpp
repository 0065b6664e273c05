// Chord and count handling for key input
#include "json_pager_input.hpp"

#include <cstddef>

const Bindings &defaultBindings()
{
    static const Bindings bindings = {
        {{'j'}, Action::MoveDown},
        {{Keys::Down}, Action::MoveDown},
        {{Keys::ctrl('n')}, Action::MoveDown},
        {{'k'}, Action::MoveUp},
        {{Keys::Up}, Action::MoveUp},
        {{Keys::ctrl('p')}, Action::MoveUp},
        {{'g', 'g'}, Action::MoveToTop},
        {{Keys::Home}, Action::MoveToTop},
        {{'G'}, Action::MoveToBottom},
        {{Keys::End}, Action::MoveToBottom},
        {{'J'}, Action::NextSibling},
        {{'K'}, Action::PrevSibling},
        {{'h'}, Action::CollapseOrParent},
        {{Keys::Left}, Action::CollapseOrParent},
        {{'l'}, Action::ExpandOrChild},
        {{Keys::Right}, Action::ExpandOrChild},
        {{'p'}, Action::Parent},
        {{Keys::Enter}, Action::ToggleCollapse},
        {{Keys::Space}, Action::ToggleCollapse},
        {{'z', 'a'}, Action::ToggleCollapse},
        {{'z', 'o'}, Action::Expand},
        {{'z', 'c'}, Action::Collapse},
        {{'z', 'O'}, Action::ExpandRecursive},
        {{'z', 'C'}, Action::CollapseRecursive},
        {{'z', 'R'}, Action::ExpandAll},
        {{'z', 'M'}, Action::CollapseAll},
        {{Keys::ctrl('e')}, Action::ScrollDown},
        {{Keys::ctrl('y')}, Action::ScrollUp},
        {{Keys::ctrl('d')}, Action::HalfPageDown},
        {{Keys::ctrl('u')}, Action::HalfPageUp},
        {{Keys::ctrl('f')}, Action::PageDown},
        {{Keys::PageDown}, Action::PageDown},
        {{Keys::ctrl('b')}, Action::PageUp},
        {{Keys::PageUp}, Action::PageUp},
        {{'z', 't'}, Action::CursorToTop},
        {{'z', 'z'}, Action::CursorToCenter},
        {{'z', 'b'}, Action::CursorToBottom},
        {{'z', 'h'}, Action::ScrollLeft},
        {{'z', 'l'}, Action::ScrollRight},
        {{'z', 'H'}, Action::ScrollHalfLeft},
        {{'z', 'L'}, Action::ScrollHalfRight},
        {{'0'}, Action::ScrollLeftmost},
        {{'/'}, Action::SearchForward},
        {{'?'}, Action::SearchBackward},
        {{'n'}, Action::NextMatch},
        {{'N'}, Action::PrevMatch},
        {{'c'}, Action::ClearSearch},
        {{'y', 'y'}, Action::CopyValue},
        {{'y', 'p'}, Action::CopyPath},
        {{Keys::F1}, Action::Help},
        {{'q'}, Action::Quit},
        {{Keys::ctrl('c')}, Action::Quit},
    };
    return bindings;
}

InputStateMachine::InputStateMachine() : InputStateMachine(defaultBindings())
{
}

InputStateMachine::InputStateMachine(const Bindings &table) : bindings(table)
{
    for (const auto &entry : bindings)
    {
        const std::vector<int> &keys = entry.first;
        for (std::size_t n = 1; n < keys.size(); ++n)
            prefixes.insert(std::vector<int>(keys.begin(), keys.begin() + n));
    }
}

void InputStateMachine::reset()
{
    sequence.clear();
    count = 0;
    hasCount = false;
}

std::string InputStateMachine::pendingText() const
{
    std::string text;
    if (hasCount)
        text = std::to_string(count);
    for (int key : sequence)
    {
        if (key >= 0x20 && key < 0x7f)
            text.push_back(static_cast<char>(key));
        else
            text += "?";
    }
    return text;
}

bool InputStateMachine::feed(int key, Command &command)
{
    if (searching)
        return feedSearch(key, command);

    // A leading 0 is a command of its own.
    if (sequence.empty() && key >= '0' && key <= '9' && (key != '0' || hasCount))
    {
        count = count * 10 + (key - '0');
        if (count > kMaxCount)
            count = kMaxCount;
        hasCount = true;
        return false;
    }

    sequence.push_back(key);
    auto it = bindings.find(sequence);
    if (it == bindings.end())
    {
        if (prefixes.count(sequence) == 0)
            reset();
        return false;
    }

    Action action = it->second;
    long typedCount = count;
    bool typed = hasCount;
    reset();

    if (action == Action::SearchForward || action == Action::SearchBackward)
    {
        searching = true;
        forward = action == Action::SearchForward;
        pattern.clear();
        return false;
    }

    command = Command();
    command.action = action;
    command.hasCount = typed;
    command.count = typed ? typedCount : 1;
    return true;
}

// Removes the last UTF-8 encoded character.
static void popCharacter(std::string &s)
{
    while (!s.empty())
    {
        unsigned char c = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((c & 0xC0) != 0x80)
            break;
    }
}

bool InputStateMachine::feedSearch(int key, Command &command)
{
    if (key == Keys::Enter)
    {
        searching = false;
        command = Command();
        command.action = Action::Search;
        command.pattern = pattern;
        command.forward = forward;
        pattern.clear();
        return true;
    }
    if (key == Keys::Escape)
    {
        searching = false;
        pattern.clear();
        return false;
    }
    if (key == Keys::Backspace)
    {
        if (pattern.empty())
            searching = false;
        else
            popCharacter(pattern);
        return false;
    }
    if (key == Keys::ctrl('u'))
    {
        pattern.clear();
        return false;
    }
    // Bytes of multi-byte characters arrive one at a time.
    if (key >= 0x20 && key < 0x100 && key != 0x7f)
        pattern.push_back(static_cast<char>(key));
    return false;
}
