#include "json_pager_viewport.hpp"

#include <gtest/gtest.h>

class ViewportTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        view.setSize(10, 80);
        view.setLineCount(100);
        view.setScrolloff(3);
    }

    Viewport view;
};

TEST_F(ViewportTest, ScrollingIsClamped)
{
    view.scrollTo(500);
    EXPECT_EQ(view.top(), 90u);
    EXPECT_EQ(view.bottom(), 100u);
    view.scrollBy(-1000);
    EXPECT_EQ(view.top(), 0u);
    view.scrollBy(7);
    EXPECT_EQ(view.top(), 7u);
    EXPECT_TRUE(view.contains(16));
    EXPECT_FALSE(view.contains(17));
}

TEST_F(ViewportTest, ShortDocumentNeverScrolls)
{
    view.setLineCount(4);
    view.scrollTo(3);
    EXPECT_EQ(view.top(), 0u);
    EXPECT_EQ(view.bottom(), 4u);
}

TEST_F(ViewportTest, ShrinkingClampsTheTop)
{
    view.scrollTo(90);
    view.setLineCount(50);
    EXPECT_EQ(view.top(), 40u);
    view.setSize(60, 80);
    EXPECT_EQ(view.top(), 0u);
}

TEST_F(ViewportTest, KeepVisibleHonoursScrolloff)
{
    view.keepVisible(20);
    EXPECT_EQ(view.top(), 14u);
    view.keepVisible(15);
    EXPECT_EQ(view.top(), 12u);
    view.keepVisible(13);
    EXPECT_EQ(view.top(), 10u);
    // No margin at the document edges.
    view.keepVisible(0);
    EXPECT_EQ(view.top(), 0u);
    view.keepVisible(99);
    EXPECT_EQ(view.top(), 90u);
}

TEST_F(ViewportTest, EffectiveScrolloffIsLimitedByHeight)
{
    EXPECT_EQ(view.effectiveScrolloff(), 3);
    view.setSize(4, 80);
    EXPECT_EQ(view.effectiveScrolloff(), 1);
    view.setSize(1, 80);
    EXPECT_EQ(view.effectiveScrolloff(), 0);
    view.setSize(0, 0);
    EXPECT_EQ(view.height(), 1);
    EXPECT_EQ(view.width(), 1);
}

TEST_F(ViewportTest, PlaceLine)
{
    view.placeAtTop(50);
    EXPECT_EQ(view.top(), 47u);
    view.placeAtCenter(50);
    EXPECT_EQ(view.top(), 46u);
    view.placeAtBottom(50);
    EXPECT_EQ(view.top(), 44u);
    view.placeAtBottom(2);
    EXPECT_EQ(view.top(), 0u);
    view.placeAtTop(99);
    EXPECT_EQ(view.top(), 90u);
}

TEST_F(ViewportTest, HorizontalOffset)
{
    view.setHorizontalOffset(500, 100);
    EXPECT_EQ(view.horizontalOffset(), 20u);
    view.scrollHorizontallyBy(-5, 100);
    EXPECT_EQ(view.horizontalOffset(), 15u);
    view.scrollHorizontallyBy(-50, 100);
    EXPECT_EQ(view.horizontalOffset(), 0u);
    // Content narrower than the window cannot scroll.
    view.scrollHorizontallyBy(10, 60);
    EXPECT_EQ(view.horizontalOffset(), 0u);
}
