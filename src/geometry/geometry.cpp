#include "geometry/geometry.h"
#include "errors.h"
#include <sstream>

namespace zc {

bool StringToPosition(const std::string& posStr, Position& pos) {
    if (posStr == "TOP_LEFT") { pos = Position::TOP_LEFT; return true; }
    if (posStr == "TOP_RIGHT") { pos = Position::TOP_RIGHT; return true; }
    if (posStr == "BOTTOM_LEFT") { pos = Position::BOTTOM_LEFT; return true; }
    if (posStr == "BOTTOM_RIGHT") { pos = Position::BOTTOM_RIGHT; return true; }
    if (posStr == "CENTER") { pos = Position::CENTER; return true; }
    if (posStr == "TOP_CENTER") { pos = Position::TOP_CENTER; return true; }
    if (posStr == "BOTTOM_CENTER") { pos = Position::BOTTOM_CENTER; return true; }
    if (posStr == "CENTER_LEFT") { pos = Position::CENTER_LEFT; return true; }
    if (posStr == "CENTER_RIGHT") { pos = Position::CENTER_RIGHT; return true; }
    return false;
}

std::string PositionToString(Position pos) {
    switch (pos) {
        case Position::TOP_LEFT: return "TOP_LEFT";
        case Position::TOP_RIGHT: return "TOP_RIGHT";
        case Position::BOTTOM_LEFT: return "BOTTOM_LEFT";
        case Position::BOTTOM_RIGHT: return "BOTTOM_RIGHT";
        case Position::CENTER: return "CENTER";
        case Position::TOP_CENTER: return "TOP_CENTER";
        case Position::BOTTOM_CENTER: return "BOTTOM_CENTER";
        case Position::CENTER_LEFT: return "CENTER_LEFT";
        case Position::CENTER_RIGHT: return "CENTER_RIGHT";
        default: return "BOTTOM_CENTER";
    }
}

Point anchorPoint(const BoundingBox& bbox, Position anchor) {
    float cx = (bbox.x1 + bbox.x2) / 2.0f;
    float cy = (bbox.y1 + bbox.y2) / 2.0f;

    switch (anchor) {
        case Position::TOP_LEFT:
            return Point(bbox.x1, bbox.y1);
        case Position::TOP_RIGHT:
            return Point(bbox.x2, bbox.y1);
        case Position::BOTTOM_LEFT:
            return Point(bbox.x1, bbox.y2);
        case Position::BOTTOM_RIGHT:
            return Point(bbox.x2, bbox.y2);
        case Position::CENTER:
            return Point(cx, cy);
        case Position::TOP_CENTER:
            return Point(cx, bbox.y1);
        case Position::CENTER_LEFT:
            return Point(bbox.x1, cy);
        case Position::CENTER_RIGHT:
            return Point(bbox.x2, cy);
        case Position::BOTTOM_CENTER:
        default:
            return Point(cx, bbox.y2);
    }
}

ReferenceSpace::ReferenceSpace(float width, float height)
    : width_(width), height_(height) {
    if (!(width > 0.0f) || !(height > 0.0f) || !std::isfinite(width) || !std::isfinite(height)) {
        throw ValidationError("Reference space must have a positive finite size");
    }
}

bool ReferenceSpace::contains(const Point& p) const {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
        return false;
    }
    return p.x >= 0.0f && p.x <= width_ && p.y >= 0.0f && p.y <= height_;
}

void ReferenceSpace::requireInside(const Point& p, const std::string& what) const {
    if (!contains(p)) {
        std::ostringstream msg;
        msg << what << " [" << p.x << ", " << p.y << "] is outside the reference space "
            << width_ << "x" << height_;
        throw ValidationError(msg.str());
    }
}

} // namespace zc
