// DrawSurface.h
#pragma once

struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

struct ScreenPoint {
    float x = 0.0f;
    float y = 0.0f;
};

// Immediate-mode 2D target the scene renderer draws into. Coordinates are
// pixels with the origin at the top-left corner of the viewport.
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual void fillPolygon(const ScreenPoint* points, int count, const Color& color) = 0;
    virtual void strokeLine(float x1, float y1, float x2, float y2,
                            const Color& color, float width) = 0;
};
