#pragma once

#include <QSize>
#include <QString>

namespace creak {

/// The nine anchor positions a popup can be attached to.
enum class Edge {
    TopLeft,
    Top,
    TopRight,
    Left,
    Center,
    Right,
    BottomLeft,
    Bottom,
    BottomRight
};

QString edgeName(Edge edge);

/// Parses "top-left", "top", ..., "bottom-right". Returns false for unknown names.
bool edgeFromName(const QString& name, Edge* edge);

bool isTopRow(Edge edge);
bool isBottomRow(Edge edge);
bool isLeftColumn(Edge edge);
bool isRightColumn(Edge edge);

/// Metadata for one currently visible popup, persisted in the state directory.
struct NotificationRecord {
    quint64 id = 0;
    QString name;
    QString className;
    Edge edge = Edge::Top;
    int offset = 0;          // distance along the stacking axis
    QSize size{0, 0};
    qint64 createdAtMs = 0;  // ms since epoch
    qint64 timeoutMs = 0;    // 0 = until cleared
    qint64 ownerPid = 0;
    QString summary;

    /// 0 when the popup has no timeout.
    qint64 expiresAtMs() const { return timeoutMs > 0 ? createdAtMs + timeoutMs : 0; }

    /// Same id, owner and creation time: the registration this record was
    /// made by, not a later popup that reuses the id.
    bool isSameRegistration(const NotificationRecord& other) const
    {
        return id == other.id && ownerPid == other.ownerPid && createdAtMs == other.createdAtMs;
    }

    bool operator==(const NotificationRecord& other) const;
    bool operator!=(const NotificationRecord& other) const { return !(*this == other); }
};

/// First line of the message, trimmed and cut to 120 characters.
QString messageSummary(const QString& message);

} // namespace creak
