// Scroll state of the document window
#include "json_pager_viewport.hpp"

#include <algorithm>

static std::size_t saturatingSub(std::size_t a, std::size_t b)
{
    return a > b ? a - b : 0;
}

std::size_t Viewport::maxTop() const
{
    return saturatingSub(total, static_cast<std::size_t>(rows));
}

void Viewport::setLineCount(std::size_t count)
{
    total = count;
    topLine = std::min(topLine, maxTop());
}

void Viewport::setSize(int height, int width)
{
    rows = std::max(height, 1);
    columns = std::max(width, 1);
    topLine = std::min(topLine, maxTop());
}

std::size_t Viewport::bottom() const
{
    return std::min(topLine + static_cast<std::size_t>(rows), total);
}

void Viewport::scrollTo(std::size_t line)
{
    topLine = std::min(line, maxTop());
}

void Viewport::scrollBy(long long delta)
{
    if (delta < 0)
        topLine = saturatingSub(topLine, static_cast<std::size_t>(-delta));
    else
        topLine = std::min(topLine + static_cast<std::size_t>(delta), maxTop());
}

int Viewport::effectiveScrolloff() const
{
    return std::min(scrolloffLines, (rows - 1) / 2);
}

void Viewport::keepVisible(std::size_t line)
{
    const std::size_t margin = static_cast<std::size_t>(effectiveScrolloff());
    if (line < topLine + margin)
        topLine = saturatingSub(line, margin);
    else if (line + margin >= topLine + static_cast<std::size_t>(rows))
        topLine = line + margin + 1 - static_cast<std::size_t>(rows);
    topLine = std::min(topLine, maxTop());
}

void Viewport::placeAtTop(std::size_t line)
{
    scrollTo(saturatingSub(line, static_cast<std::size_t>(effectiveScrolloff())));
}

void Viewport::placeAtCenter(std::size_t line)
{
    scrollTo(saturatingSub(line, static_cast<std::size_t>((rows - 1) / 2)));
}

void Viewport::placeAtBottom(std::size_t line)
{
    const std::size_t below = static_cast<std::size_t>(effectiveScrolloff());
    scrollTo(saturatingSub(line + below + 1, static_cast<std::size_t>(rows)));
}

void Viewport::setHorizontalOffset(std::size_t offset, std::size_t contentWidth)
{
    leftColumn = std::min(offset, saturatingSub(contentWidth, static_cast<std::size_t>(columns)));
}

void Viewport::scrollHorizontallyBy(long long delta, std::size_t contentWidth)
{
    if (delta < 0)
        setHorizontalOffset(saturatingSub(leftColumn, static_cast<std::size_t>(-delta)), contentWidth);
    else
        setHorizontalOffset(leftColumn + static_cast<std::size_t>(delta), contentWidth);
}
