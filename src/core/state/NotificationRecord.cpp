#include "NotificationRecord.hpp"

namespace creak {

namespace {

struct EdgeNameEntry {
    Edge edge;
    const char* name;
};

constexpr EdgeNameEntry EDGE_NAMES[] = {
    {Edge::TopLeft, "top-left"},
    {Edge::Top, "top"},
    {Edge::TopRight, "top-right"},
    {Edge::Left, "left"},
    {Edge::Center, "center"},
    {Edge::Right, "right"},
    {Edge::BottomLeft, "bottom-left"},
    {Edge::Bottom, "bottom"},
    {Edge::BottomRight, "bottom-right"},
};

constexpr int SUMMARY_MAX_LENGTH = 120;

} // namespace

QString edgeName(Edge edge)
{
    for (const auto& entry : EDGE_NAMES) {
        if (entry.edge == edge)
            return QString::fromLatin1(entry.name);
    }
    return {};
}

bool edgeFromName(const QString& name, Edge* edge)
{
    for (const auto& entry : EDGE_NAMES) {
        if (name == QLatin1String(entry.name)) {
            if (edge)
                *edge = entry.edge;
            return true;
        }
    }
    return false;
}

bool isTopRow(Edge edge)
{
    return edge == Edge::TopLeft || edge == Edge::Top || edge == Edge::TopRight;
}

bool isBottomRow(Edge edge)
{
    return edge == Edge::BottomLeft || edge == Edge::Bottom || edge == Edge::BottomRight;
}

bool isLeftColumn(Edge edge)
{
    return edge == Edge::TopLeft || edge == Edge::Left || edge == Edge::BottomLeft;
}

bool isRightColumn(Edge edge)
{
    return edge == Edge::TopRight || edge == Edge::Right || edge == Edge::BottomRight;
}

bool NotificationRecord::operator==(const NotificationRecord& other) const
{
    return id == other.id
        && name == other.name
        && className == other.className
        && edge == other.edge
        && offset == other.offset
        && size == other.size
        && createdAtMs == other.createdAtMs
        && timeoutMs == other.timeoutMs
        && ownerPid == other.ownerPid
        && summary == other.summary;
}

QString messageSummary(const QString& message)
{
    QString summary = message.section(QLatin1Char('\n'), 0, 0).trimmed();
    if (summary.size() > SUMMARY_MAX_LENGTH)
        summary.truncate(SUMMARY_MAX_LENGTH);
    return summary;
}

} // namespace creak
