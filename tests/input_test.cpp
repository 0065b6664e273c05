#include "json_pager_input.hpp"

#include <gtest/gtest.h>

#include <string>

class InputTest : public ::testing::Test
{
protected:
    // Feeds every key and returns true if the last one completed a command.
    bool type(const std::string &keys)
    {
        bool completed = false;
        for (char c : keys)
            completed = input.feed(static_cast<unsigned char>(c), command);
        return completed;
    }

    InputStateMachine input;
    Command command;
};

TEST_F(InputTest, SingleKey)
{
    ASSERT_TRUE(type("j"));
    EXPECT_EQ(command.action, Action::MoveDown);
    EXPECT_EQ(command.count, 1);
    EXPECT_FALSE(command.hasCount);
    EXPECT_FALSE(input.pending());
}

TEST_F(InputTest, SpecialKeys)
{
    ASSERT_TRUE(input.feed(Keys::Down, command));
    EXPECT_EQ(command.action, Action::MoveDown);
    ASSERT_TRUE(input.feed(Keys::ctrl('d'), command));
    EXPECT_EQ(command.action, Action::HalfPageDown);
    ASSERT_TRUE(input.feed(Keys::F1, command));
    EXPECT_EQ(command.action, Action::Help);
    ASSERT_TRUE(input.feed(Keys::Enter, command));
    EXPECT_EQ(command.action, Action::ToggleCollapse);
}

TEST_F(InputTest, Count)
{
    EXPECT_FALSE(type("12"));
    EXPECT_TRUE(input.pending());
    EXPECT_EQ(input.pendingText(), "12");
    ASSERT_TRUE(type("j"));
    EXPECT_EQ(command.count, 12);
    EXPECT_TRUE(command.hasCount);

    ASSERT_TRUE(type("10G"));
    EXPECT_EQ(command.action, Action::MoveToBottom);
    EXPECT_EQ(command.count, 10);
}

TEST_F(InputTest, CountIsLimited)
{
    ASSERT_TRUE(type("99999999j"));
    EXPECT_EQ(command.count, InputStateMachine::kMaxCount);
}

TEST_F(InputTest, LeadingZeroIsACommand)
{
    ASSERT_TRUE(type("0"));
    EXPECT_EQ(command.action, Action::ScrollLeftmost);
    EXPECT_FALSE(command.hasCount);
}

TEST_F(InputTest, Chords)
{
    EXPECT_FALSE(type("g"));
    EXPECT_TRUE(input.pending());
    EXPECT_EQ(input.pendingText(), "g");
    ASSERT_TRUE(type("g"));
    EXPECT_EQ(command.action, Action::MoveToTop);

    EXPECT_FALSE(type("3z"));
    EXPECT_EQ(input.pendingText(), "3z");
    ASSERT_TRUE(type("M"));
    EXPECT_EQ(command.action, Action::CollapseAll);
    EXPECT_EQ(command.count, 3);

    ASSERT_TRUE(type("zO"));
    EXPECT_EQ(command.action, Action::ExpandRecursive);
    ASSERT_TRUE(type("yp"));
    EXPECT_EQ(command.action, Action::CopyPath);
}

TEST_F(InputTest, AbandonedChordDiscardsEverything)
{
    EXPECT_FALSE(type("3zx"));
    EXPECT_FALSE(input.pending());
    // The count does not carry over.
    ASSERT_TRUE(type("j"));
    EXPECT_EQ(command.count, 1);

    // The key that broke the chord is not reinterpreted.
    EXPECT_FALSE(type("gj"));
    EXPECT_FALSE(input.pending());
}

TEST_F(InputTest, UnboundKeyIsIgnored)
{
    EXPECT_FALSE(type("X"));
    EXPECT_FALSE(input.pending());
}

TEST_F(InputTest, SearchInput)
{
    EXPECT_FALSE(type("/"));
    EXPECT_TRUE(input.inSearchInput());
    EXPECT_TRUE(input.searchForward());
    EXPECT_FALSE(type("ab"));
    EXPECT_EQ(input.searchInput(), "ab");
    EXPECT_FALSE(input.feed(Keys::Backspace, command));
    EXPECT_EQ(input.searchInput(), "a");
    // Keys that are bindings elsewhere are just text here.
    EXPECT_FALSE(type("jq"));
    EXPECT_EQ(input.searchInput(), "ajq");

    ASSERT_TRUE(input.feed(Keys::Enter, command));
    EXPECT_EQ(command.action, Action::Search);
    EXPECT_EQ(command.pattern, "ajq");
    EXPECT_TRUE(command.forward);
    EXPECT_FALSE(input.inSearchInput());
}

TEST_F(InputTest, BackwardSearch)
{
    type("?x");
    EXPECT_FALSE(input.searchForward());
    ASSERT_TRUE(input.feed(Keys::Enter, command));
    EXPECT_FALSE(command.forward);
}

TEST_F(InputTest, CancellingSearchInput)
{
    type("/abc");
    EXPECT_FALSE(input.feed(Keys::Escape, command));
    EXPECT_FALSE(input.inSearchInput());

    type("/a");
    input.feed(Keys::Backspace, command);
    EXPECT_TRUE(input.inSearchInput());
    input.feed(Keys::Backspace, command);
    EXPECT_FALSE(input.inSearchInput());

    type("/abc");
    input.feed(Keys::ctrl('u'), command);
    EXPECT_TRUE(input.inSearchInput());
    EXPECT_EQ(input.searchInput(), "");
}

TEST_F(InputTest, BackspaceRemovesWholeCharacters)
{
    type("/a\xc3\xa9");
    EXPECT_EQ(input.searchInput(), "a\xc3\xa9");
    input.feed(Keys::Backspace, command);
    EXPECT_EQ(input.searchInput(), "a");
}

TEST_F(InputTest, EveryDefaultBindingIsReachable)
{
    for (const auto &entry : defaultBindings())
    {
        InputStateMachine fresh;
        Command result;
        bool completed = false;
        for (int key : entry.first)
            completed = fresh.feed(key, result);
        if (entry.second == Action::SearchForward || entry.second == Action::SearchBackward)
        {
            EXPECT_TRUE(fresh.inSearchInput());
            continue;
        }
        ASSERT_TRUE(completed);
        EXPECT_EQ(result.action, entry.second);
    }
}

TEST(InputCustomBindingsTest, UsesTheGivenTable)
{
    Bindings bindings;
    bindings[{'x', 'y'}] = Action::Quit;
    InputStateMachine input(bindings);
    Command command;
    EXPECT_FALSE(input.feed('x', command));
    EXPECT_TRUE(input.pending());
    ASSERT_TRUE(input.feed('y', command));
    EXPECT_EQ(command.action, Action::Quit);
    EXPECT_FALSE(input.feed('j', command));
}
