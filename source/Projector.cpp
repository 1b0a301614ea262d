// Projector.cpp
#include "Projector.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

void syncCamera(Camera& cam, const Pose& pose) {
    cam.x = pose.x;
    cam.y = pose.y;
    cam.yaw = pose.heading;
}

CameraSpacePoint toCameraSpace(const Camera& cam, const Vec3& p) {
    const float dx = p.x - cam.x;
    const float dy = p.y - cam.y;
    const float dz = p.z - cam.z;

    const float angle = -(cam.yaw - cam.headingOffset);
    const float cosYaw = std::cos(angle);
    const float sinYaw = std::sin(angle);

    CameraSpacePoint out;
    out.lateral = dx * cosYaw - dy * sinYaw;
    out.forward = dx * sinYaw + dy * cosYaw;
    out.up = dz;
    return out;
}

float focalLength(const Camera& cam, const Viewport& viewport) {
    return (static_cast<float>(viewport.width) * 0.5f) / std::tan(cam.fov * 0.5f);
}

bool project(const RenderContext& ctx, const Vec3& p, ProjectedPoint& out) {
    const Camera& cam = ctx.camera;
    const CameraSpacePoint c = toCameraSpace(cam, p);

    if (c.forward <= cam.nearPlane || c.forward > cam.farPlane)
        return false;

    const float depth = std::max(c.forward, cam.nearPlane);
    const float f = focalLength(cam, ctx.viewport);
    const float halfW = static_cast<float>(ctx.viewport.width) * 0.5f;
    const float halfH = static_cast<float>(ctx.viewport.height) * 0.5f;

    out.x = (c.lateral / depth) * f + halfW;
    out.y = halfH - (c.up / depth) * f;
    out.depth = depth;
    return true;
}

bool validateRenderContext(const RenderContext& ctx) {
    if (ctx.viewport.width <= 0 || ctx.viewport.height <= 0) {
        std::printf("Invalid viewport %dx%d\n", ctx.viewport.width, ctx.viewport.height);
        return false;
    }
    if (ctx.camera.nearPlane <= 0.0f || ctx.camera.farPlane <= ctx.camera.nearPlane) {
        std::printf("Invalid clip range: near %.3f far %.3f\n",
                    ctx.camera.nearPlane, ctx.camera.farPlane);
        return false;
    }
    if (ctx.camera.fov <= 0.0f || ctx.camera.fov >= kPi) {
        std::printf("Invalid field of view: %.3f rad\n", ctx.camera.fov);
        return false;
    }
    if (ctx.grid.spacing <= 0.0f) {
        std::printf("Invalid grid spacing: %.3f\n", ctx.grid.spacing);
        return false;
    }
    return true;
}
