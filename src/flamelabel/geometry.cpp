#include <flamelabel/geometry.h>

#include <algorithm>

namespace flamelabel {

Rect Rect::transform(const glm::dmat3& m) const {
    const glm::dvec3 corners[] = {
        m * glm::dvec3(x, y, 1.0),
        m * glm::dvec3(x + width, y, 1.0),
        m * glm::dvec3(x, y + height, 1.0),
        m * glm::dvec3(x + width, y + height, 1.0),
    };

    double minX = corners[0].x, maxX = corners[0].x;
    double minY = corners[0].y, maxY = corners[0].y;
    for (const auto& c : corners) {
        minX = std::min(minX, c.x);
        maxX = std::max(maxX, c.x);
        minY = std::min(minY, c.y);
        maxY = std::max(maxY, c.y);
    }
    return Rect{minX, minY, maxX - minX, maxY - minY};
}

glm::dmat3 rectToRectTransform(const Rect& from, const Rect& to) {
    double sx = from.width != 0.0 ? to.width / from.width : 1.0;
    double sy = from.height != 0.0 ? to.height / from.height : 1.0;

    glm::dmat3 m(1.0);
    m[0][0] = sx;
    m[1][1] = sy;
    m[2][0] = to.x - from.x * sx;
    m[2][1] = to.y - from.y * sy;
    return m;
}

} // namespace flamelabel
