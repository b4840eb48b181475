#pragma once

#include "core/state/NotificationRecord.hpp"
#include <QList>
#include <QMargins>
#include <QRect>
#include <QSize>

namespace creak {

/// Offset along the stacking axis for a new popup at `edge`.
///
/// Siblings at the same edge are stacked in registration order, each
/// taking its height plus `gap`. The result is a snapshot: popups already on
/// screen are never moved when an earlier one goes away. `center` does not
/// stack and always returns `defaultOffset`.
int stackOffset(Edge edge, const QList<NotificationRecord>& siblings, int gap, int defaultOffset);

/// Screen rectangle for a popup of `size` at `edge` with the given stacking offset.
/// Top-row popups grow downward, bottom-row popups upward; popups in the middle
/// row start vertically centered and grow downward.
QRect popupGeometry(const QRect& screen, Edge edge, const QSize& size,
                    int edgeMargin, int offset, int defaultOffset);

/// Screen sides a layer-shell surface is anchored to, and its margin from
/// each anchored side. A side that is not anchored leaves the compositor to
/// center the surface along that axis.
struct EdgeAnchors {
    bool top = false;
    bool bottom = false;
    bool left = false;
    bool right = false;
    QMargins margins;
};

/// Anchors that put a popup at `geometry` (from popupGeometry()) on a
/// compositor that positions surfaces itself. Bottom-row popups hang from the
/// bottom side, all others from the top; left and right columns keep their
/// side margin and the middle column is centered.
EdgeAnchors edgeAnchors(const QRect& screen, Edge edge, const QRect& geometry);

} // namespace creak
