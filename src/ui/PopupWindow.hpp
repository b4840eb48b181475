#pragma once

#include "core/PopupOptions.hpp"
#include "core/popup/IPopupSurface.hpp"
#include <QFont>
#include <QRasterWindow>
#include <utility>

namespace creak {

/// Frameless, always-on-top, non-focusable window drawing one popup:
/// a rounded, bordered box with the message centered and word-wrapped.
///
/// On Wayland the window becomes a layer-shell overlay anchored to the
/// popup's screen sides; elsewhere it is simply moved to its geometry.
class PopupWindow : public QRasterWindow, public IPopupSurface {
    Q_OBJECT
public:
    explicit PopupWindow(const PopupStyle& style, QWindow* parent = nullptr);

    QRect screenGeometry() const override;
    QSize measure(const QString& message) const override;
    bool createSurface(const QRect& geometry, Edge edge, const QString& message) override;
    void destroySurface() override;
    QString errorString() const override { return errorString_; }
    void setDismissHandler(DismissHandler handler) override { dismissHandler_ = std::move(handler); }

    /// "Family Size", e.g. "DejaVu Sans 14". A missing size keeps the default.
    static QFont fontFromDescription(const QString& description);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;

private:
    void anchorToScreen(const QRect& geometry, Edge edge);

    int frameWidth() const { return style_.padding + style_.borderSize; }
    int textFlags() const;

    PopupStyle style_;
    QFont font_;
    QString message_;
    QString errorString_;
    DismissHandler dismissHandler_;
};

} // namespace creak
