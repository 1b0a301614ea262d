// Geometry.h
#pragma once

#include <vector>
#include "RenderContext.h"

enum class ShapeKind {
    Box,
    Tank,
    Point
};

// width runs along local x (the heading direction), depth along local y,
// height along z.
struct BoxDimensions {
    float width = 40.0f;
    float height = 40.0f;
    float depth = 40.0f;
};

struct TankDimensions {
    float hullBottomWidth = 24.0f;
    float hullBottomDepth = 19.0f;
    float hullTopWidth = 20.0f;
    float hullTopDepth = 15.0f;
    float hullHeight = 10.0f;
    float turretWidth = 12.0f;
    float turretDepth = 10.0f;
    float turretHeight = 8.0f;
    float barrelLength = 15.0f;
    float barrelThickness = 3.0f;
};

struct ShapeDescriptor {
    ShapeKind kind = ShapeKind::Box;
    BoxDimensions box;
    TankDimensions tank;
    float pointLength = 10.0f; // streak length drawn for point-like entities
};

struct RenderableEntity {
    Pose pose;
    float z = 0.0f; // base height above the ground
    ShapeDescriptor shape;
    float alpha = 1.0f;
};

// Frustum of a rectangle pyramid: bottom quad and top quad, both centered on
// (centerX, centerY) in the owner's local frame.
struct PrismShape {
    float centerX = 0.0f;
    float centerY = 0.0f;
    float baseZ = 0.0f;
    float height = 0.0f;
    float bottomHalfWidth = 0.0f;
    float bottomHalfDepth = 0.0f;
    float topHalfWidth = 0.0f;
    float topHalfDepth = 0.0f;
};

// All generators append world-space vertices to `vertices` and faces whose
// indices point into it. Face winding is counter-clockwise seen from outside,
// so (v1 - v0) x (v2 - v0) is the outward normal.
void appendPrism(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                 const PrismShape& prism, const Pose& pose, float z);

// Axis-aligned box; z is the bottom of the box. Always emits 8 vertices and
// 6 faces (front, right, back, left, top, bottom).
void generateBox(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                 float x, float y, float z, float width, float height, float depth);

// Hull, turret and barrel sharing the pose's rotation and translation.
void generateTank(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                  const Pose& pose, float z, const TankDimensions& dims);

void generateFaces(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                   const RenderableEntity& entity);

std::vector<Edge> uniqueEdges(const std::vector<Face>& faces);
