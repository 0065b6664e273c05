#include <ncursesw/curses.h>
#include <locale.h>
#include <signal.h>
#include <unistd.h>
#include <wchar.h>

#include "json_pager_config.hpp"
#include "json_pager_controller.hpp"
#include "json_pager_core.hpp"
#include "json_pager_flatten.hpp"
#include "json_pager_input.hpp"
#include "json_pager_loader.hpp"
#include "json_pager_parser.hpp"
#include "json_pager_render.hpp"
#include "json_pager_search.hpp"
#include "json_pager_tree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Color scheme for easy customization.  Every entry can be overridden under
// "colors" in the config file.
namespace ColorScheme
{
    constexpr int NORMAL_FG = COLOR_WHITE;
    constexpr int PUNCTUATION_FG = COLOR_BLUE;
    constexpr int KEY_NAMES_FG = COLOR_CYAN;
    constexpr int STRING_VALUES_FG = COLOR_GREEN;
    constexpr int NUMBER_VALUES_FG = COLOR_MAGENTA;
    constexpr int BOOLEAN_VALUES_FG = COLOR_YELLOW;
    constexpr int NULL_VALUES_FG = COLOR_RED;
    constexpr int ANNOTATION_FG = COLOR_BLUE;
    constexpr int SEARCH_MATCH_FG = COLOR_BLACK;
    constexpr int SEARCH_MATCH_BG = COLOR_YELLOW;
    constexpr int CURRENT_MATCH_FG = COLOR_BLACK;
    constexpr int CURRENT_MATCH_BG = COLOR_GREEN;
    constexpr int CURSOR_FG = COLOR_BLACK;
    constexpr int CURSOR_BG = COLOR_CYAN;
    constexpr int STATUS_BAR_FG = COLOR_BLACK;
    constexpr int STATUS_BAR_BG = COLOR_WHITE;

    // Background colors (-1 means use default terminal background)
    constexpr int DEFAULT_BG = -1;

    // Color pair indices (internal use only)
    enum ColorPairs
    {
        NORMAL_TEXT = 1,
        PUNCTUATION,
        KEY_NAMES,
        STRING_VALUES,
        NUMBER_VALUES,
        BOOLEAN_VALUES,
        NULL_VALUES,
        ANNOTATION,
        SEARCH_MATCH,
        CURRENT_MATCH,
        CURSOR_LINE,
        STATUS_BAR
    };
}

// Interactive pager for JSON documents.
//
// Pass a file name on the command line, or pipe JSON into the program.  The
// document is shown as indented, syntax highlighted text in which every
// object and array can be folded.  Keys follow vim: j/k move, h/l fold and
// unfold, z-prefixed chords fold recursively or scroll, / and ? search with
// regular expressions.  Large inputs are parsed in the background and can be
// browsed while they load.

static volatile sig_atomic_t quitRequested = 0;

static void requestQuit(int)
{
    quitRequested = 1;
}

// Owns the curses screen.  When stdin carries the document, keyboard input
// is read from the controlling terminal instead.
class TerminalSession
{
public:
    TerminalSession()
    {
        if (!isatty(STDIN_FILENO))
        {
            ttyInput = std::fopen("/dev/tty", "r");
            if (ttyInput == nullptr)
                throw IoError("Cannot open /dev/tty for keyboard input");
            screen = newterm(nullptr, stdout, ttyInput);
            if (screen == nullptr)
            {
                std::fclose(ttyInput);
                throw IoError("Cannot initialise the terminal");
            }
            set_term(screen);
        }
        else
        {
            initscr();
        }
        raw();
        noecho();
        keypad(stdscr, TRUE);
        curs_set(0);
        // Wake up regularly so background loading shows progress.
        timeout(100);
        colours = has_colors();
    }

    ~TerminalSession()
    {
        endwin();
        if (screen != nullptr)
            delscreen(screen);
        if (ttyInput != nullptr)
            std::fclose(ttyInput);
    }

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    bool hasColours() const { return colours; }

private:
    SCREEN *screen = nullptr;
    FILE *ttyInput = nullptr;
    bool colours = false;
};

static int colorFor(const Settings &settings, const char *role, int fallback)
{
    auto it = settings.colors.find(role);
    return it == settings.colors.end() ? fallback : it->second;
}

static void initColours(const Settings &settings)
{
    start_color();
    use_default_colors();
    init_pair(ColorScheme::NORMAL_TEXT, ColorScheme::NORMAL_FG, ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::PUNCTUATION, colorFor(settings, "punctuation", ColorScheme::PUNCTUATION_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::KEY_NAMES, colorFor(settings, "key", ColorScheme::KEY_NAMES_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::STRING_VALUES, colorFor(settings, "string", ColorScheme::STRING_VALUES_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::NUMBER_VALUES, colorFor(settings, "number", ColorScheme::NUMBER_VALUES_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::BOOLEAN_VALUES, colorFor(settings, "boolean", ColorScheme::BOOLEAN_VALUES_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::NULL_VALUES, colorFor(settings, "null", ColorScheme::NULL_VALUES_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::ANNOTATION, colorFor(settings, "annotation", ColorScheme::ANNOTATION_FG), ColorScheme::DEFAULT_BG);
    init_pair(ColorScheme::SEARCH_MATCH, ColorScheme::SEARCH_MATCH_FG, colorFor(settings, "search_match", ColorScheme::SEARCH_MATCH_BG));
    init_pair(ColorScheme::CURRENT_MATCH, ColorScheme::CURRENT_MATCH_FG, colorFor(settings, "current_match", ColorScheme::CURRENT_MATCH_BG));
    init_pair(ColorScheme::CURSOR_LINE, ColorScheme::CURSOR_FG, colorFor(settings, "cursor", ColorScheme::CURSOR_BG));
    init_pair(ColorScheme::STATUS_BAR, ColorScheme::STATUS_BAR_FG, colorFor(settings, "status_bar", ColorScheme::STATUS_BAR_BG));
}

// Maps curses key codes onto the codes the input state machine knows.
static int translateKey(int ch)
{
    switch (ch)
    {
    case KEY_UP:
        return Keys::Up;
    case KEY_DOWN:
        return Keys::Down;
    case KEY_LEFT:
        return Keys::Left;
    case KEY_RIGHT:
        return Keys::Right;
    case KEY_HOME:
        return Keys::Home;
    case KEY_END:
        return Keys::End;
    case KEY_PPAGE:
        return Keys::PageUp;
    case KEY_NPAGE:
        return Keys::PageDown;
    case KEY_BACKSPACE:
    case 127:
    case 8:
        return Keys::Backspace;
    case KEY_ENTER:
    case '\r':
        return Keys::Enter;
    default:
        break;
    }
    if (ch == KEY_F(1))
        return Keys::F1;
    if (ch >= 0 && ch < 0x100)
        return ch;
    return -1;
}

struct Pager
{
    ValueTree tree;
    Controller controller{tree};
    SearchEngine search;
    InputStateMachine input;
    DocumentLoader loader;
    Settings settings;
    DisplayOptions display;
    std::string sourceName;
    std::string message;   // shown until the next key press
    std::string loadError; // shown while a partial document is displayed
    bool showingHelp = false;
    bool colours = false;
    bool running = true;
};

static attr_t styleAttr(Style style, bool colours)
{
    if (!colours)
    {
        if (style == Style::Key)
            return A_BOLD;
        if (style == Style::Annotation)
            return A_DIM;
        return A_NORMAL;
    }
    switch (style)
    {
    case Style::Punctuation:
        return COLOR_PAIR(ColorScheme::PUNCTUATION);
    case Style::Key:
        return COLOR_PAIR(ColorScheme::KEY_NAMES);
    case Style::String:
        return COLOR_PAIR(ColorScheme::STRING_VALUES);
    case Style::Number:
        return COLOR_PAIR(ColorScheme::NUMBER_VALUES);
    case Style::Boolean:
        return COLOR_PAIR(ColorScheme::BOOLEAN_VALUES);
    case Style::Null:
        return COLOR_PAIR(ColorScheme::NULL_VALUES);
    case Style::Annotation:
        return COLOR_PAIR(ColorScheme::ANNOTATION) | A_DIM;
    case Style::Plain:
        break;
    }
    return COLOR_PAIR(ColorScheme::NORMAL_TEXT);
}

// Draws one rendered row starting `hoffset` display columns into the text.
// Returns the number of screen columns used.
static int drawLine(int row, const RenderedLine &line, bool isCursor, std::size_t hoffset, int cols, bool colours)
{
    const attr_t cursorAttr = colours ? COLOR_PAIR(ColorScheme::CURSOR_LINE) : A_REVERSE;
    const attr_t matchAttr = colours ? (COLOR_PAIR(ColorScheme::SEARCH_MATCH) | A_BOLD) : A_UNDERLINE;
    const attr_t currentAttr = colours ? (COLOR_PAIR(ColorScheme::CURRENT_MATCH) | A_BOLD) : (A_REVERSE | A_BOLD);

    const std::string &text = line.text;
    std::vector<attr_t> attrs(text.size(), isCursor ? cursorAttr : styleAttr(Style::Plain, colours));
    if (!isCursor)
    {
        for (const Span &span : line.spans)
            std::fill(attrs.begin() + span.begin, attrs.begin() + std::min(span.end, text.size()), styleAttr(span.style, colours));
    }
    for (const Highlight &h : line.highlights)
        std::fill(attrs.begin() + h.begin, attrs.begin() + std::min(h.end, text.size()), h.current ? currentAttr : matchAttr);

    move(row, 0);
    clrtoeol();
    mbstate_t state;
    std::memset(&state, 0, sizeof(state));
    std::size_t i = 0;
    std::size_t column = 0;
    int drawn = 0;
    while (i < text.size())
    {
        wchar_t wc = 0;
        std::size_t len = mbrtowc(&wc, text.data() + i, text.size() - i, &state);
        bool valid = true;
        if (len == static_cast<std::size_t>(-1) || len == static_cast<std::size_t>(-2))
        {
            std::memset(&state, 0, sizeof(state));
            len = 1;
            valid = false;
        }
        else if (len == 0)
        {
            len = 1;
        }
        int width = valid ? wcwidth(wc) : 1;
        if (width < 0)
            width = 1;
        if (column >= hoffset)
        {
            if (drawn + width > cols)
                break;
            attrset(attrs[i]);
            if (valid)
                addnstr(text.data() + i, static_cast<int>(len));
            else
                addch('?');
            drawn += width;
        }
        column += static_cast<std::size_t>(width);
        i += len;
    }
    attrset(A_NORMAL);
    if (isCursor && drawn < cols)
        mvchgat(row, drawn, -1, colours ? A_NORMAL : A_REVERSE, colours ? ColorScheme::CURSOR_LINE : 0, nullptr);
    return drawn;
}

static std::string progressText(const DocumentLoader &loader)
{
    LoadProgress progress = loader.progress();
    std::string text = "Loading ";
    if (loader.state() == LoadState::Reading)
    {
        text += formatFileSize(progress.bytesRead);
        if (progress.totalBytes > 0)
            text += " of " + formatFileSize(progress.totalBytes);
        text += ", " + std::to_string(progress.nodes) + " nodes";
    }
    else
    {
        text += std::to_string(progress.nodes) + " nodes";
    }
    return text;
}

static void drawStatusBar(Pager &pager, int statusRow, int cols)
{
    mvhline(statusRow, 0, ' ', cols);
    if (pager.input.inSearchInput())
    {
        std::string prompt = std::string(pager.input.searchForward() ? "/" : "?") + pager.input.searchInput();
        mvaddnstr(statusRow, 0, prompt.c_str(), static_cast<int>(prompt.size()));
        move(statusRow, std::min(getDisplayWidth(prompt), cols - 1));
        return;
    }

    std::string right;
    if (pager.input.pending())
        right += pager.input.pendingText() + "  ";
    if (pager.search.active())
    {
        const std::vector<SearchMatch> &matches = pager.search.matches();
        std::size_t current = pager.search.currentIndex();
        right += "[" + pager.search.pattern() + " ";
        if (matches.empty())
            right += "no matches";
        else
            right += (current == SearchEngine::kNoMatch ? std::string("-") : std::to_string(current + 1)) + "/" +
                     std::to_string(matches.size()) + (pager.search.truncated() ? "+" : "");
        right += "]  ";
    }
    if (pager.tree.growing())
        right += progressText(pager.loader) + "  ";
    const Cursor &cursor = pager.controller.cursor();
    right += std::to_string(pager.tree.visibleLineCount() == 0 ? 0 : cursor.line + 1) + "/" +
             std::to_string(pager.tree.visibleLineCount());

    std::string left;
    if (!pager.message.empty())
        left = pager.message;
    else if (!pager.loadError.empty())
        left = pager.loadError;
    else
    {
        left = pager.controller.focusedPathText();
        if (left.empty())
            left = "(empty)";
        if (pager.tree.lineDelimited() && cursor.node != kNoNode)
        {
            NodeIndex top = cursor.node;
            while (pager.tree.node(top).parent != kDocumentRoot)
                top = pager.tree.node(top).parent;
            left = "[" + std::to_string(pager.tree.node(top).indexInParent) + "] " + left;
        }
    }

    int rightWidth = getDisplayWidth(right);
    int available = cols - rightWidth - 2;
    std::string name = shortenPath(pager.sourceName, std::max(0, available / 3));
    std::string status = name + "  " + left;
    if (getDisplayWidth(status) > available)
        status = truncateToWidth(status, std::max(0, available));

    mvaddnstr(statusRow, 0, status.c_str(), static_cast<int>(status.size()));
    if (rightWidth < cols)
        mvaddnstr(statusRow, cols - rightWidth, right.c_str(), static_cast<int>(right.size()));
    mvchgat(statusRow, 0, -1, pager.colours ? A_NORMAL : A_REVERSE, pager.colours ? ColorScheme::STATUS_BAR : 0, nullptr);
}

// Display a help box listing all key bindings on top of the document.
static void drawHelp(int rows, int cols)
{
    std::string copyLine = "  yy / yp          Copy value / path to clipboard";
    if (!osc52Likely())
        copyLine += std::getenv("TMUX") ? " (tmux: requires OSC 52 config)" : " (no terminal support)";

    const std::vector<std::string> lines = {
        "json-pager Key Bindings:",
        "",
        "  j / k, ↑/↓       Move down / up (count prefix repeats)",
        "  gg / G           First / last line (with count: go to line)",
        "  J / K            Next / previous sibling",
        "  h / l, ←/→       Collapse or go to parent / expand or go to child",
        "  p                Go to parent",
        "  Enter, Space, za Toggle the focused container",
        "  zo / zc          Expand / collapse the focused container",
        "  zO / zC          Expand / collapse recursively",
        "  zR / zM          Expand / collapse everything (zM with count: depth)",
        "  Ctrl-E / Ctrl-Y  Scroll one line down / up",
        "  Ctrl-D / Ctrl-U  Scroll half a page down / up",
        "  Ctrl-F / Ctrl-B  Page down / up",
        "  zt / zz / zb     Put the focused line at top / center / bottom",
        "  zh / zl, zH / zL Scroll left / right by a column / half a screen",
        "  0                Scroll to the leftmost column",
        "  / and ?          Search forward / backward (regular expression)",
        "  n / N            Next / previous match",
        "  c                Clear search results",
        copyLine,
        "  F1               Show this help screen",
        "  q                Quit the program",
        "",
        "Press any key to return..."};

    int total = static_cast<int>(lines.size());
    int maxWidth = 0;
    for (const auto &line : lines)
        maxWidth = std::max(maxWidth, getDisplayWidth(line));

    int boxWidth = maxWidth + 4; // 2 chars padding on each side
    int boxHeight = total + 2;   // top and bottom border
    int startRow = std::max(0, (rows - boxHeight) / 2);
    int startCol = std::max(0, (cols - boxWidth) / 2);

    mvaddstr(startRow, startCol, "┌");
    for (int i = 1; i <= boxWidth - 1; ++i)
        addstr("─");
    addstr("┐");

    for (int i = 0; i < total && startRow + 1 + i < rows - 1; ++i)
    {
        mvaddstr(startRow + 1 + i, startCol, "│");
        addstr("  ");
        addstr(lines[i].c_str());
        for (int j = getDisplayWidth(lines[i]) + 2; j < boxWidth - 1; ++j)
            addstr(" ");
        addstr("│");
    }

    if (startRow + boxHeight - 1 < rows)
    {
        mvaddstr(startRow + boxHeight - 1, startCol, "└");
        for (int i = 1; i < boxWidth; ++i)
            addstr("─");
        addstr("┘");
    }
}

static void drawScreen(Pager &pager)
{
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    const Viewport &view = pager.controller.viewport();

    std::vector<Line> lines;
    linesIn(pager.tree, view.top(), view.bottom(), lines);

    std::vector<RenderedLine> rendered;
    rendered.reserve(lines.size());
    std::size_t widest = 0;
    for (const Line &line : lines)
    {
        rendered.push_back(renderLine(pager.tree, line, pager.display, &pager.search));
        widest = std::max(widest, static_cast<std::size_t>(getDisplayWidth(rendered.back().text)));
    }
    pager.controller.setContentWidth(widest);

    erase();
    const std::size_t cursorLine = pager.controller.cursor().line;
    for (std::size_t i = 0; i < rendered.size(); ++i)
    {
        bool isCursor = view.top() + i == cursorLine;
        drawLine(static_cast<int>(i), rendered[i], isCursor, view.horizontalOffset(), cols, pager.colours);
    }
    if (pager.tree.empty())
        mvaddstr(0, 0, pager.tree.growing() ? "Loading..." : "No data to display");

    if (pager.showingHelp)
        drawHelp(rows, cols);
    drawStatusBar(pager, rows - 1, cols);
    curs_set(pager.input.inSearchInput() ? 1 : 0);
    refresh();
}

static void runSearch(Pager &pager, const Command &command)
{
    if (command.pattern.empty())
        return;
    try
    {
        pager.search.setPattern(command.pattern, caseSensitiveFor(pager.settings, command.pattern));
    }
    catch (const InvalidPatternError &ex)
    {
        pager.message = ex.what();
        return;
    }
    pager.search.setForward(command.forward);
    pager.search.findAll(pager.tree);

    NodeIndex target = kNoNode;
    if (!pager.search.matchFrom(pager.controller.cursor().node, command.forward, target))
    {
        pager.message = "Pattern not found: " + command.pattern;
        return;
    }
    pager.controller.focusNode(target);
    if (pager.search.wrapped())
        pager.message = command.forward ? "search hit BOTTOM, continuing at TOP" : "search hit TOP, continuing at BOTTOM";
}

// Moves to the next match in `forward` direction from the cursor.
static void stepMatch(Pager &pager, bool forward)
{
    if (!pager.search.active())
    {
        pager.message = "No previous search pattern";
        return;
    }
    if (pager.search.matches().empty())
    {
        pager.message = "Pattern not found: " + pager.search.pattern();
        return;
    }
    NodeIndex target = kNoNode;
    const SearchMatch *current = pager.search.current();
    if (current != nullptr && current->node == pager.controller.cursor().node)
    {
        if (forward)
            pager.search.nextMatch(target);
        else
            pager.search.prevMatch(target);
    }
    else
    {
        pager.search.matchFrom(pager.controller.cursor().node, forward, target);
    }
    pager.controller.focusNode(target);
    if (pager.search.wrapped())
        pager.message = forward ? "search hit BOTTOM, continuing at TOP" : "search hit TOP, continuing at BOTTOM";
}

static void copyText(Pager &pager, const std::string &text, const std::string &what)
{
    if (text.empty())
        return;
    if (copyToClipboard(text) || !osc52Likely())
        pager.message = getClipboardStatusMessage(what);
    else
        pager.message = what + " is too large for the clipboard";
}

static void execute(Pager &pager, const Command &command)
{
    Controller &controller = pager.controller;
    const long count = command.count;
    const int halfWidth = std::max(1, controller.viewport().width() / 2);
    switch (command.action)
    {
    case Action::MoveDown:
        controller.moveBy(count);
        break;
    case Action::MoveUp:
        controller.moveBy(-count);
        break;
    case Action::MoveToTop:
        if (command.hasCount)
            controller.moveToLine(static_cast<std::size_t>(count - 1));
        else
            controller.moveToTop();
        break;
    case Action::MoveToBottom:
        if (command.hasCount)
            controller.moveToLine(static_cast<std::size_t>(count - 1));
        else
            controller.moveToBottom();
        break;
    case Action::NextSibling:
        for (long i = 0; i < count && controller.moveToSibling(true); ++i)
        {
        }
        break;
    case Action::PrevSibling:
        for (long i = 0; i < count && controller.moveToSibling(false); ++i)
        {
        }
        break;
    case Action::CollapseOrParent:
        controller.collapseOrParent();
        break;
    case Action::ExpandOrChild:
        controller.expandOrFirstChild();
        break;
    case Action::Parent:
        for (long i = 0; i < count && controller.moveToParent(); ++i)
        {
        }
        break;
    case Action::ToggleCollapse:
        controller.toggleFocusedCollapse();
        break;
    case Action::Expand:
        controller.expandFocused();
        break;
    case Action::Collapse:
        controller.collapseFocused();
        break;
    case Action::ExpandRecursive:
        controller.expandFocusedRecursive();
        break;
    case Action::CollapseRecursive:
        controller.collapseFocusedRecursive();
        break;
    case Action::ExpandAll:
        if (!controller.expandAll())
            pager.message = "Still loading, try again when the document is complete";
        break;
    case Action::CollapseAll:
        if (!controller.collapseAll(command.hasCount ? static_cast<int>(count) : 0))
            pager.message = "Still loading, try again when the document is complete";
        break;
    case Action::ScrollDown:
        controller.scrollViewBy(count);
        break;
    case Action::ScrollUp:
        controller.scrollViewBy(-count);
        break;
    case Action::HalfPageDown:
        controller.halfPageDown();
        break;
    case Action::HalfPageUp:
        controller.halfPageUp();
        break;
    case Action::PageDown:
        for (long i = 0; i < count; ++i)
            controller.pageDown();
        break;
    case Action::PageUp:
        for (long i = 0; i < count; ++i)
            controller.pageUp();
        break;
    case Action::CursorToTop:
        controller.focusedLineToTop();
        break;
    case Action::CursorToCenter:
        controller.focusedLineToCenter();
        break;
    case Action::CursorToBottom:
        controller.focusedLineToBottom();
        break;
    case Action::ScrollLeft:
        controller.scrollHorizontallyBy(-count);
        break;
    case Action::ScrollRight:
        controller.scrollHorizontallyBy(count);
        break;
    case Action::ScrollHalfLeft:
        controller.scrollHorizontallyBy(-halfWidth);
        break;
    case Action::ScrollHalfRight:
        controller.scrollHorizontallyBy(halfWidth);
        break;
    case Action::ScrollLeftmost:
        controller.scrollToLeftmost();
        break;
    case Action::Search:
        runSearch(pager, command);
        break;
    case Action::NextMatch:
        stepMatch(pager, pager.search.forward());
        break;
    case Action::PrevMatch:
        stepMatch(pager, !pager.search.forward());
        break;
    case Action::ClearSearch:
        pager.search.clear();
        break;
    case Action::CopyValue:
        copyText(pager, controller.focusedValueText(pager.display.indentWidth), "Value");
        break;
    case Action::CopyPath:
        copyText(pager, controller.focusedPathText(), "Path");
        break;
    case Action::Help:
        pager.showingHelp = true;
        break;
    case Action::Quit:
        pager.running = false;
        break;
    case Action::SearchForward:
    case Action::SearchBackward:
    case Action::None:
        break;
    }
}

// Runs the control loop until the user quits.  Returns false when loading
// failed before anything could be shown.
static bool runPager(Pager &pager)
{
    int rows = 0;
    int cols = 0;
    bool dirty = true;
    bool wasGrowing = true;
    while (pager.running && !quitRequested)
    {
        if (pager.loader.poll(pager.tree))
        {
            pager.controller.treeChanged();
            dirty = true;
        }
        if (wasGrowing && !pager.tree.growing())
        {
            LoadState state = pager.loader.state();
            if (state == LoadState::Failed)
            {
                if (pager.tree.empty())
                    return false;
                pager.loadError = pager.loader.error();
            }
            // Matches found while loading only covered part of the document.
            if (pager.search.active())
                pager.search.findAll(pager.tree);
            dirty = true;
        }
        wasGrowing = pager.tree.growing();
        if (wasGrowing)
            dirty = true;

        int newRows, newCols;
        getmaxyx(stdscr, newRows, newCols);
        if (newRows != rows || newCols != cols)
        {
            rows = newRows;
            cols = newCols;
            pager.controller.resize(std::max(1, rows - 1), cols);
            dirty = true;
        }

        if (dirty)
        {
            drawScreen(pager);
            dirty = false;
        }

        int ch = getch();
        if (ch == ERR)
            continue;
        dirty = true;
        if (ch == KEY_RESIZE)
            continue;
        pager.message.clear();
        if (pager.showingHelp)
        {
            pager.showingHelp = false;
            continue;
        }

        int key = translateKey(ch);
        if (key < 0)
            continue;
        Command command;
        if (pager.input.feed(key, command))
            execute(pager, command);
    }
    return true;
}

// Display command-line usage information
static void showUsage(const char *progName)
{
    std::cout << "json-pager - Interactive pager for JSON documents\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << progName << " [options] [file.json]\n";
    std::cout << "  cat data.json | " << progName << " [options]\n\n";
    std::cout << "DESCRIPTION:\n";
    std::cout << "  Shows a JSON document as foldable, syntax highlighted text and lets you\n";
    std::cout << "  navigate and search it with vim-style keys. With no file argument, or with\n";
    std::cout << "  \"-\", the document is read from standard input. Press F1 inside the pager\n";
    std::cout << "  for the list of key bindings.\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -l, --lines        Input holds one JSON value per line\n";
    std::cout << "  -d, --depth N      Start with containers at depth N and deeper collapsed\n";
    std::cout << "  -c, --config FILE  Read settings from FILE\n";
    std::cout << "      --log FILE     Write a log to FILE\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "      --version      Show version information\n\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << progName << " data.json\n";
    std::cout << "  " << progName << " -l events.ndjson\n";
    std::cout << "  curl -s https://api.example.com/data | " << progName << "\n";
}

static bool parseDepth(const char *text, int &depth)
{
    char *end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0 || value > 100000)
        return false;
    depth = static_cast<int>(value);
    return true;
}

// Entry point
int main(int argc, char **argv)
{
    // Enable UTF-8 locale for proper Unicode support
    setlocale(LC_ALL, "");

    std::string path;
    std::string configPath;
    std::string logPath;
    bool lineDelimited = false;
    int depth = -1;
    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];
        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0)
        {
            showUsage(argv[0]);
            return 0;
        }
        if (strcmp(arg, "--version") == 0)
        {
            std::cout << "json-pager version " << kVersion << "\n";
            return 0;
        }
        if (strcmp(arg, "-l") == 0 || strcmp(arg, "--lines") == 0)
        {
            lineDelimited = true;
        }
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0 || strcmp(arg, "--log") == 0 ||
                 strcmp(arg, "-d") == 0 || strcmp(arg, "--depth") == 0)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing argument for " << arg << std::endl;
                return 1;
            }
            const char *value = argv[++i];
            if (strcmp(arg, "--log") == 0)
                logPath = value;
            else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--depth") == 0)
            {
                if (!parseDepth(value, depth))
                {
                    std::cerr << "Invalid depth: " << value << std::endl;
                    return 1;
                }
            }
            else
                configPath = value;
        }
        else if (arg[0] == '-' && arg[1] != '\0')
        {
            std::cerr << "Unknown option: " << arg << "\nTry '" << argv[0] << " --help'." << std::endl;
            return 1;
        }
        else if (path.empty())
        {
            path = arg;
        }
        else
        {
            std::cerr << "Only one input file can be given." << std::endl;
            return 1;
        }
    }
    if (path.empty())
        path = "-";

    if (!configPath.empty() && access(configPath.c_str(), R_OK) != 0)
    {
        std::cerr << "Failed to open config file: " << configPath << std::endl;
        return 1;
    }
    if (path != "-" && access(path.c_str(), R_OK) != 0)
    {
        std::cerr << "Failed to open file: " << path << " (" << std::strerror(errno) << ")" << std::endl;
        return 1;
    }
    if (path == "-" && isatty(STDIN_FILENO))
    {
        showUsage(argv[0]);
        return 1;
    }

    Pager pager;
    pager.settings = loadSettings(configPath.empty() ? defaultConfigPath() : configPath);
    if (!logPath.empty())
        pager.settings.logFile = logPath;
    try
    {
        setupLogging(pager.settings.logFile, pager.settings.logLevel);
    }
    catch (const spdlog::spdlog_ex &ex)
    {
        std::cerr << "Failed to open log file: " << ex.what() << std::endl;
        return 1;
    }
    for (const std::string &warning : pager.settings.warnings)
        spdlog::warn("{}", warning);

    pager.display.mode = pager.settings.displayMode;
    pager.display.indentWidth = pager.settings.indentWidth;
    pager.search.setScope(pager.settings.searchKeys, pager.settings.searchValues);
    pager.controller.setScrolloff(pager.settings.scrolloff);
    pager.sourceName = path == "-" ? "(stdin)" : path;

    ParseOptions options;
    options.mode = lineDelimited ? InputMode::LineDelimited : InputMode::Json;
    options.allowSpecialNumbers = pager.settings.allowSpecialNumbers;
    options.initialDepth = depth >= 0 ? depth : pager.settings.initialDepth;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = requestQuit;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    pager.loader.start(path, options);

    bool shown = false;
    try
    {
        TerminalSession session;
        pager.colours = session.hasColours();
        if (pager.colours)
            initColours(pager.settings);
        shown = runPager(pager);
    }
    catch (const std::exception &ex)
    {
        pager.loader.cancel();
        spdlog::error("{}", ex.what());
        std::cerr << ex.what() << std::endl;
        return 1;
    }
    pager.loader.cancel();

    if (!shown)
    {
        std::cerr << "Error reading " << pager.sourceName << ": " << pager.loader.error() << std::endl;
        return 1;
    }
    return 0;
}
