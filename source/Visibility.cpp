// Visibility.cpp
#include "Visibility.h"
#include "Projector.h"

Vec3 faceNormal(const std::vector<Vec3>& vertices, const Face& face) {
    const Vec3& v0 = vertices[face.indices[0]];
    const Vec3& v1 = vertices[face.indices[1]];
    const Vec3& v2 = vertices[face.indices[2]];
    return cross(v1 - v0, v2 - v0);
}

Vec3 faceCentroid(const std::vector<Vec3>& vertices, const Face& face) {
    Vec3 sum;
    for (int idx : face.indices) {
        sum += vertices[idx];
    }
    return sum * (1.0f / static_cast<float>(face.indices.size()));
}

bool isFrontFacing(const Vec3& normal, const Vec3& centroid, const Vec3& eye) {
    return dot(normal, eye - centroid) > 0.0f;
}

bool faceInClipRange(const RenderContext& ctx, const std::vector<Vec3>& vertices,
                     const Face& face) {
    ProjectedPoint p;
    for (int idx : face.indices) {
        if (!project(ctx, vertices[idx], p))
            return false;
    }
    return true;
}

int collectVisibleFaces(RenderContext& ctx, const std::vector<Face>& faces) {
    const std::vector<Vec3>& vertices = ctx.frame.vertices;
    const Vec3 eye(ctx.camera.x, ctx.camera.y, ctx.camera.z);

    int kept = 0;
    for (const Face& face : faces) {
        const Vec3 centroid = faceCentroid(vertices, face);
        if (!isFrontFacing(faceNormal(vertices, face), centroid, eye))
            continue;
        if (!faceInClipRange(ctx, vertices, face))
            continue;

        SceneFace sf;
        sf.face = face;
        sf.distance = distance3D(centroid, eye);
        ctx.frame.faces.push_back(sf);
        ++kept;
    }
    return kept;
}
