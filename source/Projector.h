// Projector.h
#pragma once

#include "RenderContext.h"

struct ProjectedPoint {
    float x = 0.0f;
    float y = 0.0f;
    float depth = 0.0f;
};

// Camera-space coordinates of a world point: lateral is positive to the
// right, forward along the view axis, up along world z.
struct CameraSpacePoint {
    float lateral = 0.0f;
    float forward = 0.0f;
    float up = 0.0f;
};

void syncCamera(Camera& cam, const Pose& pose);

CameraSpacePoint toCameraSpace(const Camera& cam, const Vec3& p);
float focalLength(const Camera& cam, const Viewport& viewport);

// Returns false when the point is at or behind the near plane or beyond the
// far plane; out is left untouched in that case. Screen y grows downward and
// world height is subtracted from the center, so higher points land higher
// on screen.
bool project(const RenderContext& ctx, const Vec3& p, ProjectedPoint& out);

// Startup check for the configuration errors the per-frame code does not
// guard against. Logs the problem and returns false.
bool validateRenderContext(const RenderContext& ctx);
