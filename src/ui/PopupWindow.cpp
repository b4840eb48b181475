#include "PopupWindow.hpp"
#include "core/popup/StackPlacement.hpp"
#include <LayerShellQt/Window>
#include <QFontMetrics>
#include <QGuiApplication>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScreen>
#include <QSurfaceFormat>
#include <QTimer>
#include <boost/log/trivial.hpp>

namespace creak {

namespace {

QFont::StyleStrategy styleStrategy(TextAntialias antialias)
{
    switch (antialias) {
    case TextAntialias::None: return QFont::NoAntialias;
    case TextAntialias::Gray: return QFont::NoSubpixelAntialias;
    case TextAntialias::Subpixel: return QFont::PreferAntialias;
    case TextAntialias::Default: break;
    }
    return QFont::PreferDefault;
}

QFont::HintingPreference hintingPreference(TextHint hint)
{
    switch (hint) {
    case TextHint::None: return QFont::PreferNoHinting;
    case TextHint::Slight: return QFont::PreferVerticalHinting;
    case TextHint::Medium:
    case TextHint::Full: return QFont::PreferFullHinting;
    case TextHint::Default: break;
    }
    return QFont::PreferDefaultHinting;
}

bool isWayland()
{
    return QGuiApplication::platformName().startsWith(QLatin1String("wayland"));
}

} // namespace

PopupWindow::PopupWindow(const PopupStyle& style, QWindow* parent)
    : QRasterWindow(parent)
    , style_(style)
    , font_(fontFromDescription(style.font))
{
    font_.setStyleStrategy(styleStrategy(style.antialias));
    font_.setHintingPreference(hintingPreference(style.hint));

    setFlags(Qt::ToolTip | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
             | Qt::WindowDoesNotAcceptFocus);

    QSurfaceFormat fmt = format();
    fmt.setAlphaBufferSize(8);
    setFormat(fmt);
}

QFont PopupWindow::fontFromDescription(const QString& description)
{
    QStringList words = description.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    QFont font;

    bool ok = false;
    const qreal size = words.isEmpty() ? 0 : words.last().toDouble(&ok);
    if (ok && size > 0) {
        font.setPointSizeF(size);
        words.removeLast();
    }
    if (!words.isEmpty())
        font.setFamily(words.join(QLatin1Char(' ')));
    return font;
}

int PopupWindow::textFlags() const
{
    return Qt::AlignCenter | Qt::TextWordWrap;
}

QRect PopupWindow::screenGeometry() const
{
    const QScreen* target = screen() ? screen() : QGuiApplication::primaryScreen();
    return target ? target->geometry() : QRect();
}

QSize PopupWindow::measure(const QString& message) const
{
    const QFontMetrics metrics(font_);
    const int innerWidth = qMax(1, style_.width - 2 * frameWidth());
    const QRect text = metrics.boundingRect(QRect(0, 0, innerWidth, 0), textFlags(), message);

    // Words longer than the minimum width widen the popup.
    return QSize(qMax(style_.width, text.width() + 2 * frameWidth()),
                 text.height() + 2 * frameWidth());
}

bool PopupWindow::createSurface(const QRect& geometry, Edge edge, const QString& message)
{
    if (!QGuiApplication::primaryScreen()) {
        errorString_ = QStringLiteral("no screen available");
        return false;
    }

    message_ = message;
    if (isWayland()) {
        // Clients cannot place their own windows there; the compositor does it from the anchors.
        resize(geometry.size());
        anchorToScreen(geometry, edge);
    } else {
        setGeometry(geometry);
    }
    show();

    if (!handle()) {
        errorString_ = QStringLiteral("the platform did not create a window");
        return false;
    }
    return true;
}

void PopupWindow::anchorToScreen(const QRect& geometry, Edge edge)
{
    // Must be configured before the platform window exists.
    auto* layerWindow = LayerShellQt::Window::get(this);
    if (!layerWindow) {
        BOOST_LOG_TRIVIAL(warning) << "PopupWindow: no layer-shell support, the compositor places the popup";
        return;
    }

    const EdgeAnchors anchors = edgeAnchors(screenGeometry(), edge, geometry);
    LayerShellQt::Window::Anchors flags;
    if (anchors.top)
        flags |= LayerShellQt::Window::AnchorTop;
    if (anchors.bottom)
        flags |= LayerShellQt::Window::AnchorBottom;
    if (anchors.left)
        flags |= LayerShellQt::Window::AnchorLeft;
    if (anchors.right)
        flags |= LayerShellQt::Window::AnchorRight;

    layerWindow->setLayer(LayerShellQt::Window::LayerOverlay);
    layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityNone);
    layerWindow->setAnchors(flags);
    layerWindow->setMargins(anchors.margins);
    layerWindow->setExclusiveZone(0);
    layerWindow->setScope(QStringLiteral("creak"));

    BOOST_LOG_TRIVIAL(debug) << "PopupWindow: layer-shell anchors " << flags.toInt()
                             << " margins " << anchors.margins.left() << "," << anchors.margins.top()
                             << "," << anchors.margins.right() << "," << anchors.margins.bottom();
}

void PopupWindow::destroySurface()
{
    hide();
    destroy();
}

void PopupWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(QRect(QPoint(0, 0), size()), Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    const qreal inset = style_.borderSize / 2.0;
    QPainterPath path;
    path.addRoundedRect(QRectF(QPointF(0, 0), QSizeF(size())).adjusted(inset, inset, -inset, -inset),
                        style_.borderRadius, style_.borderRadius);
    painter.fillPath(path, style_.background);
    if (style_.borderSize > 0) {
        painter.setPen(QPen(style_.border, style_.borderSize));
        painter.drawPath(path);
    }

    painter.setFont(font_);
    painter.setPen(style_.text);
    const int frame = frameWidth();
    painter.drawText(QRect(QPoint(0, 0), size()).adjusted(frame, frame, -frame, -frame),
                     textFlags(), message_);
}

void PopupWindow::mousePressEvent(QMouseEvent* event)
{
    event->accept();
    // Teardown destroys this window, so leave the event handler first.
    QTimer::singleShot(0, this, [this]() {
        if (dismissHandler_)
            dismissHandler_();
    });
}

} // namespace creak
