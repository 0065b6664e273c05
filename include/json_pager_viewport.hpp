#pragma once

#include <cstddef>

// Window of `height` rows over the visible lines, plus a horizontal column
// offset shared by every row.  The top line always satisfies
// 0 <= top <= max(0, lineCount - height).
class Viewport
{
public:
    void setLineCount(std::size_t count);
    std::size_t lineCount() const { return total; }

    void setSize(int height, int width);
    int height() const { return rows; }
    int width() const { return columns; }

    std::size_t top() const { return topLine; }
    // One past the last line on screen.
    std::size_t bottom() const;
    bool contains(std::size_t line) const { return line >= topLine && line < bottom(); }

    void scrollTo(std::size_t line);
    void scrollBy(long long delta);

    // Lines kept between the cursor and the window edge.
    void setScrolloff(int lines) { scrolloffLines = lines < 0 ? 0 : lines; }
    int scrolloff() const { return scrolloffLines; }
    int effectiveScrolloff() const;

    // Scrolls the least amount that shows `line` with the scrolloff margin.
    // The margin is dropped at the start and end of the document.
    void keepVisible(std::size_t line);

    // zt, zz, zb
    void placeAtTop(std::size_t line);
    void placeAtCenter(std::size_t line);
    void placeAtBottom(std::size_t line);

    std::size_t horizontalOffset() const { return leftColumn; }
    void setHorizontalOffset(std::size_t offset, std::size_t contentWidth);
    void scrollHorizontallyBy(long long delta, std::size_t contentWidth);

private:
    std::size_t total = 0;
    int rows = 1;
    int columns = 1;
    std::size_t topLine = 0;
    std::size_t leftColumn = 0;
    int scrolloffLines = 3;

    std::size_t maxTop() const;
};
