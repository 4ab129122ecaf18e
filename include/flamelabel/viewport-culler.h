#pragma once

#include <flamelabel/geometry.h>

namespace flamelabel {

/// [start, end) overlaps [viewport.left(), viewport.right()).
/// False for NaN bounds, so a malformed frame is culled rather than drawn.
inline bool intersectsViewport(double start, double end, const Rect& viewport) {
    return start < viewport.right() && end > viewport.left();
}

/// Room for at least the ellipsis once side padding is removed.
/// Children are never wider than their parent, so false culls the subtree.
inline bool wideEnoughForLabel(double paddedWidth, double minWidth) {
    return paddedWidth > minWidth;
}

} // namespace flamelabel
