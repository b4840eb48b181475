#pragma once

#include "core/state/NotificationRecord.hpp"
#include <QColor>
#include <QString>

namespace creak {

enum class TextAntialias {
    Default,
    None,
    Gray,
    Subpixel
};

enum class TextHint {
    Default,
    None,
    Slight,
    Medium,
    Full
};

struct PopupStyle {
    QString font = QStringLiteral("Sans 16");
    int width = 350;         // minimum width; long text widens the popup
    int padding = 10;
    int borderSize = 5;
    int borderRadius = 10;
    QColor background = QColor(0x1a, 0x1a, 0x1a);
    QColor text = QColor(0xff, 0xff, 0xff);
    QColor border = QColor(0xff, 0xff, 0xff);
    TextAntialias antialias = TextAntialias::Default;
    TextHint hint = TextHint::Default;
};

/// Fully resolved settings for one invocation: built-in defaults, then the
/// style file, then the command line.
struct PopupOptions {
    Edge edge = Edge::Top;
    qint64 timeoutMs = 5000;  // 0 = stay until cleared or clicked
    bool stack = true;
    int stackGap = 10;
    int defaultOffset = 20;
    int edgeMargin = 20;

    QString name;
    QString className;
    QString message;

    QString stateDir;         // empty = default location

    PopupStyle style;
};

/// "#RRGGBB" or "#RRGGBBAA" (alpha last, unlike QColor's own #AARRGGBB).
bool parseHexColor(const QString& value, QColor* color);

bool textAntialiasFromName(const QString& name, TextAntialias* value);
bool textHintFromName(const QString& name, TextHint* value);

} // namespace creak
