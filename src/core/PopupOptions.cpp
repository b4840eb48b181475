#include "PopupOptions.hpp"

namespace creak {

bool parseHexColor(const QString& value, QColor* color)
{
    QString hex = value.trimmed();
    if (hex.startsWith(QLatin1Char('#')))
        hex.remove(0, 1);
    if (hex.size() != 6 && hex.size() != 8)
        return false;

    int channels[4] = {0, 0, 0, 255};
    for (int i = 0; i < hex.size() / 2; ++i) {
        bool ok = false;
        channels[i] = hex.mid(i * 2, 2).toInt(&ok, 16);
        if (!ok || channels[i] < 0)
            return false;
    }

    if (color)
        *color = QColor(channels[0], channels[1], channels[2], channels[3]);
    return true;
}

bool textAntialiasFromName(const QString& name, TextAntialias* value)
{
    TextAntialias v;
    if (name == "default") v = TextAntialias::Default;
    else if (name == "none") v = TextAntialias::None;
    else if (name == "gray") v = TextAntialias::Gray;
    else if (name == "subpixel") v = TextAntialias::Subpixel;
    else return false;

    if (value)
        *value = v;
    return true;
}

bool textHintFromName(const QString& name, TextHint* value)
{
    TextHint v;
    if (name == "default") v = TextHint::Default;
    else if (name == "none") v = TextHint::None;
    else if (name == "slight") v = TextHint::Slight;
    else if (name == "medium") v = TextHint::Medium;
    else if (name == "full") v = TextHint::Full;
    else return false;

    if (value)
        *value = v;
    return true;
}

} // namespace creak
