#include "StackPlacement.hpp"
#include <algorithm>

namespace creak {

int stackOffset(Edge edge, const QList<NotificationRecord>& siblings, int gap, int defaultOffset)
{
    if (edge == Edge::Center)
        return defaultOffset;

    QList<NotificationRecord> stacked;
    for (const auto& sibling : siblings) {
        if (sibling.edge == edge)
            stacked.append(sibling);
    }
    std::sort(stacked.begin(), stacked.end(),
              [](const NotificationRecord& a, const NotificationRecord& b) {
                  if (a.createdAtMs != b.createdAtMs)
                      return a.createdAtMs < b.createdAtMs;
                  return a.id < b.id;
              });

    int offset = defaultOffset;
    for (const auto& sibling : stacked)
        offset += sibling.size.height() + gap;
    return offset;
}

QRect popupGeometry(const QRect& screen, Edge edge, const QSize& size,
                    int edgeMargin, int offset, int defaultOffset)
{
    int x = screen.left() + (screen.width() - size.width()) / 2;
    if (isLeftColumn(edge))
        x = screen.left() + edgeMargin;
    else if (isRightColumn(edge))
        x = screen.left() + screen.width() - edgeMargin - size.width();

    int y;
    if (isTopRow(edge))
        y = screen.top() + offset;
    else if (isBottomRow(edge))
        y = screen.top() + screen.height() - offset - size.height();
    else
        y = screen.top() + (screen.height() - size.height()) / 2 + (offset - defaultOffset);

    return QRect(QPoint(x, y), size);
}

EdgeAnchors edgeAnchors(const QRect& screen, Edge edge, const QRect& geometry)
{
    EdgeAnchors anchors;

    if (isLeftColumn(edge)) {
        anchors.left = true;
        anchors.margins.setLeft(geometry.left() - screen.left());
    } else if (isRightColumn(edge)) {
        anchors.right = true;
        anchors.margins.setRight(screen.x() + screen.width() - geometry.x() - geometry.width());
    }

    if (isBottomRow(edge)) {
        anchors.bottom = true;
        anchors.margins.setBottom(screen.y() + screen.height() - geometry.y() - geometry.height());
    } else {
        anchors.top = true;
        anchors.margins.setTop(geometry.top() - screen.top());
    }
    return anchors;
}

} // namespace creak
