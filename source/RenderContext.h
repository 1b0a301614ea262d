// RenderContext.h
#pragma once

#include <array>
#include <vector>
#include "DrawSurface.h"
#include "Vec3.h"

// Ground-plane pose of an entity: position and heading, forward = (cos, sin).
struct Pose {
    float x = 0.0f;
    float y = 0.0f;
    float heading = 0.0f;
};

struct Camera {
    float x = 0.0f;
    float y = 0.0f;
    float z = 20.0f;              // eye height, fixed
    float yaw = 0.0f;             // copied from the tracked entity's heading
    float fov = kPi / 3.0f;       // vertical field of view
    float nearPlane = 0.1f;
    float farPlane = 1000.0f;
    // Subtracted from yaw before projecting. Entities face (cos h, sin h), so
    // pi/2 turns heading h into camera-space straight ahead.
    float headingOffset = kPi * 0.5f;
};

struct Viewport {
    int width = 800;
    int height = 600;
};

struct RenderStyle {
    Color background{0.0f, 0.0f, 0.0f, 1.0f};
    Color accent{0.659f, 0.333f, 0.969f, 1.0f}; // #a855f7
    Color grid{0.659f, 0.333f, 0.969f, 0.25f};
    float lineWidth = 2.0f;
    float gridLineWidth = 1.0f;
};

struct GridSettings {
    float spacing = 50.0f;
    float radius = 600.0f;
    bool skipAlternate = true;
};

struct Edge {
    int a = 0;
    int b = 0;
};

// Quad face; indices point into FrameBuffers::vertices.
struct Face {
    std::array<int, 4> indices{};
    std::array<Edge, 4> edges{};
};

struct SceneFace {
    Face face;
    float distance = 0.0f;
};

struct Segment3D {
    Vec3 a;
    Vec3 b;
    Color color;
    float width = 1.0f;
    float distance = 0.0f;
};

// Per-frame arena, cleared and refilled every frame.
struct FrameBuffers {
    std::vector<Vec3> vertices;
    std::vector<Face> generated; // scratch for the entity being built
    std::vector<SceneFace> faces;
    std::vector<Segment3D> segments;

    void clear() {
        vertices.clear();
        generated.clear();
        faces.clear();
        segments.clear();
    }
};

struct RenderContext {
    Camera camera;
    Viewport viewport;
    RenderStyle style;
    GridSettings grid;
    float segmentMargin = 50.0f;
    FrameBuffers frame;
    DrawSurface* surface = nullptr;
};
