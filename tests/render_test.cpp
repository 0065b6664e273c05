#include "json_pager_flatten.hpp"
#include "json_pager_parser.hpp"
#include "json_pager_render.hpp"
#include "json_pager_search.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static std::vector<std::string> renderAll(const ValueTree &tree, const DisplayOptions &options)
{
    std::vector<Line> lines;
    linesIn(tree, 0, tree.visibleLineCount(), lines);
    std::vector<std::string> texts;
    for (const Line &line : lines)
        texts.push_back(renderLine(tree, line, options).text);
    return texts;
}

static DisplayOptions dataMode()
{
    DisplayOptions options;
    options.mode = DisplayMode::Data;
    return options;
}

TEST(RenderTest, JsonModeIsExactJson)
{
    ValueTree tree = parseDocument(R"({"a":1,"b":[1,2,3]})");
    const std::vector<std::string> expected = {
        "{",
        "  \"a\": 1,",
        "  \"b\": [",
        "    1,",
        "    2,",
        "    3",
        "  ]",
        "}",
    };
    EXPECT_EQ(renderAll(tree, DisplayOptions()), expected);

    tree.toggleCollapse(3);
    const std::vector<std::string> collapsed = {"{", "  \"a\": 1,", "  \"b\": [...]", "}"};
    EXPECT_EQ(renderAll(tree, DisplayOptions()), collapsed);
}

TEST(RenderTest, IndentWidth)
{
    ValueTree tree = parseDocument(R"([[true]])");
    DisplayOptions options;
    options.indentWidth = 4;
    const std::vector<std::string> expected = {"[", "    [", "        true", "    ]", "]"};
    EXPECT_EQ(renderAll(tree, options), expected);
}

TEST(RenderTest, DataMode)
{
    ValueTree tree = parseDocument(R"({"name":"x","odd key":null,"list":[1,{"k":false}],"empty":{}})");
    // 1 obj, 2 name, 3 odd key, 4 list, 5 1, 6 {k}, 7 k, 8 empty
    tree.toggleCollapse(6);
    const std::vector<std::string> expected = {
        "{",
        "  name: \"x\"",
        "  \"odd key\": null",
        "  list: [",
        "    [0]: 1",
        "    [1]: {...} (1 key)",
        "  ]",
        "  empty: {}",
        "}",
    };
    EXPECT_EQ(renderAll(tree, dataMode()), expected);
}

TEST(RenderTest, ModesHaveTheSameRows)
{
    ValueTree tree = parseDocument(R"([{"a":[1,2]},[],{"b":"c"}])");
    tree.toggleCollapse(2);
    EXPECT_EQ(renderAll(tree, dataMode()).size(), renderAll(tree, DisplayOptions()).size());
}

TEST(RenderTest, TopLevelArrayElementsAreNotLabelled)
{
    ParseOptions options;
    options.mode = InputMode::LineDelimited;
    ValueTree tree = parseDocument("1\n\"two\"\n", options);
    const std::vector<std::string> expected = {"1", "\"two\""};
    EXPECT_EQ(renderAll(tree, dataMode()), expected);
}

TEST(RenderTest, SpansCoverStyledText)
{
    ValueTree tree = parseDocument(R"({"k":"v"})");
    Line line;
    ASSERT_TRUE(lineAt(tree, 1, line));
    RenderedLine rendered = renderLine(tree, line, DisplayOptions());
    EXPECT_EQ(rendered.text, "  \"k\": \"v\"");
    ASSERT_EQ(rendered.spans.size(), 3u);
    EXPECT_EQ(rendered.spans[0].style, Style::Key);
    EXPECT_EQ(rendered.text.substr(rendered.spans[0].begin, rendered.spans[0].end - rendered.spans[0].begin), "\"k\"");
    EXPECT_EQ(rendered.spans[1].style, Style::Punctuation);
    EXPECT_EQ(rendered.spans[2].style, Style::String);
    EXPECT_EQ(rendered.spans[2].end, rendered.text.size());
}

TEST(RenderTest, IncompleteContainerIsMarked)
{
    ValueTree tree;
    EXPECT_THROW(parseInto(tree, "[1,", ParseOptions()), ParseError);
    std::vector<Line> lines;
    linesIn(tree, 0, tree.visibleLineCount(), lines);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(renderLine(tree, lines.back(), DisplayOptions()).text, "] …");
}

TEST(RenderTest, HighlightsFollowEscapes)
{
    ValueTree tree = parseDocument(R"({"k":"a\"needle"})");
    SearchEngine search;
    search.setPattern("needle", true);
    search.findAll(tree);
    NodeIndex target = kNoNode;
    ASSERT_TRUE(search.nextMatch(target));

    Line line;
    ASSERT_TRUE(lineAt(tree, 1, line));
    RenderedLine rendered = renderLine(tree, line, DisplayOptions(), &search);
    ASSERT_EQ(rendered.highlights.size(), 1u);
    const Highlight &h = rendered.highlights[0];
    EXPECT_EQ(rendered.text.substr(h.begin, h.end - h.begin), "needle");
    EXPECT_TRUE(h.current);
}

TEST(RenderTest, KeyHighlights)
{
    ValueTree tree = parseDocument(R"({"needle":1})");
    SearchEngine search;
    search.setPattern("eed", true);
    search.findAll(tree);

    Line line;
    ASSERT_TRUE(lineAt(tree, 1, line));
    RenderedLine json = renderLine(tree, line, DisplayOptions(), &search);
    ASSERT_EQ(json.highlights.size(), 1u);
    EXPECT_EQ(json.highlights[0].begin, 4u);
    EXPECT_FALSE(json.highlights[0].current);

    RenderedLine data = renderLine(tree, line, dataMode(), &search);
    ASSERT_EQ(data.highlights.size(), 1u);
    EXPECT_EQ(data.highlights[0].begin, 3u);
}

TEST(RenderTest, EscapeString)
{
    EXPECT_EQ(escapeString("plain"), "plain");
    EXPECT_EQ(escapeString("a\"b\\c\n\t"), "a\\\"b\\\\c\\n\\t");
    EXPECT_EQ(escapeString(std::string("\x01", 1)), "\\u0001");

    std::vector<std::size_t> offsets;
    escapeString("a\nb", &offsets);
    const std::vector<std::size_t> expected = {0, 1, 3, 4};
    EXPECT_EQ(offsets, expected);
}

TEST(RenderTest, PlainIdentifiers)
{
    EXPECT_TRUE(isPlainIdentifier("abc"));
    EXPECT_TRUE(isPlainIdentifier("_a1"));
    EXPECT_FALSE(isPlainIdentifier("1a"));
    EXPECT_FALSE(isPlainIdentifier("a-b"));
    EXPECT_FALSE(isPlainIdentifier(""));
}

TEST(RenderTest, SerializeKeepsDuplicatesAndNumbers)
{
    ValueTree tree = parseDocument(R"({"a":1.50,"a":[],"b":{"c":"x\ny"}})");
    EXPECT_EQ(serializeValue(tree, 1),
              "{\n  \"a\": 1.50,\n  \"a\": [],\n  \"b\": {\n    \"c\": \"x\\ny\"\n  }\n}");
    EXPECT_EQ(serializeValue(tree, 2), "1.50");
    EXPECT_EQ(serializeValue(tree, 4, 4), "{\n    \"c\": \"x\\ny\"\n}");
    EXPECT_EQ(serializeValue(tree, kDocumentRoot), "");
}

TEST(RenderTest, NodePath)
{
    ValueTree tree = parseDocument(R"({"a":{"b":[0,1,{"odd key":true}]}})");
    // 1 obj, 2 a, 3 b, 4 0, 5 1, 6 {..}, 7 odd key
    EXPECT_EQ(nodePath(tree, 1), ".");
    EXPECT_EQ(nodePath(tree, 2), ".a");
    EXPECT_EQ(nodePath(tree, 5), ".a.b[1]");
    EXPECT_EQ(nodePath(tree, 7), ".a.b[2][\"odd key\"]");
}
