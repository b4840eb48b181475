#pragma once

#include "core/state/NotificationRecord.hpp"
#include <QRect>
#include <QSize>
#include <QString>
#include <functional>

namespace creak {

/// The on-screen window a popup process shows. The lifecycle calls
/// createSurface() and destroySurface() exactly once per display cycle.
class IPopupSurface {
public:
    using DismissHandler = std::function<void()>;

    virtual ~IPopupSurface() = default;

    /// Area popups are placed in. Empty if no screen is available.
    virtual QRect screenGeometry() const = 0;

    /// Full popup size for `message`, including padding and border.
    virtual QSize measure(const QString& message) const = 0;

    /// Shows `message` at `geometry` (screen coordinates). `edge` lets a
    /// surface that cannot place itself anchor to the right screen sides.
    virtual bool createSurface(const QRect& geometry, Edge edge, const QString& message) = 0;
    virtual void destroySurface() = 0;
    virtual QString errorString() const = 0;

    /// Called when the user dismisses the popup (e.g. clicks it).
    virtual void setDismissHandler(DismissHandler handler) = 0;
};

} // namespace creak
