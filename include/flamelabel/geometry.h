#pragma once

#include <glm/glm.hpp>
#include <cmath>

namespace flamelabel {

//=============================================================================
// Rect - axis-aligned rectangle, origin at top-left
//=============================================================================
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double left() const { return x; }
    double right() const { return x + width; }
    double top() const { return y; }
    double bottom() const { return y + height; }

    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }

    /// Map through an affine transform (column-major, m[col][row]) and return
    /// the bounding box of the four transformed corners.
    Rect transform(const glm::dmat3& m) const;
};

/// Affine transform that maps `from` onto `to`.
glm::dmat3 rectToRectTransform(const Rect& from, const Rect& to);

/// Hot-loop projection of a one-row frame rectangle at (start, depth) with
/// the given config-space width. Same result as Rect{start, depth, width, 1}
/// .transform(m), computed straight from the coefficients: each edge vector
/// contributes its absolute extent, and the origin moves by its negative part.
inline Rect projectFrameRect(double start, double depth, double width,
                             const glm::dmat3& m) {
    const double ux = width * m[0][0];
    const double uy = width * m[0][1];
    const double vx = m[1][0];
    const double vy = m[1][1];

    Rect out{
        start * m[0][0] + depth * m[1][0] + m[2][0],
        start * m[0][1] + depth * m[1][1] + m[2][1],
        std::abs(ux) + std::abs(vx),
        std::abs(uy) + std::abs(vy),
    };
    if (ux < 0.0) out.x += ux;
    if (vx < 0.0) out.x += vx;
    if (uy < 0.0) out.y += uy;
    if (vy < 0.0) out.y += vy;
    return out;
}

} // namespace flamelabel
