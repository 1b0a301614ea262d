// Geometry.cpp
#include "Geometry.h"

#include <algorithm>
#include <cmath>

// Corner layout shared by every prism:
//   bottom 0 (-w,-d)  1 (+w,-d)  2 (+w,+d)  3 (-w,+d)
//   top    4..7 in the same order
static const int kPrismFaces[6][4] = {
    {0, 1, 5, 4}, // front  (-y)
    {1, 2, 6, 5}, // right  (+x)
    {2, 3, 7, 6}, // back   (+y)
    {3, 0, 4, 7}, // left   (-x)
    {4, 5, 6, 7}, // top    (+z)
    {0, 3, 2, 1}, // bottom (-z)
};

static Face makeFace(int base, const int (&corners)[4]) {
    Face f;
    for (int i = 0; i < 4; ++i) {
        f.indices[i] = base + corners[i];
    }
    for (int i = 0; i < 4; ++i) {
        f.edges[i] = { f.indices[i], f.indices[(i + 1) % 4] };
    }
    return f;
}

void appendPrism(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                 const PrismShape& prism, const Pose& pose, float z) {
    const float cosH = std::cos(pose.heading);
    const float sinH = std::sin(pose.heading);

    auto place = [&](float lx, float ly, float lz) {
        lx += prism.centerX;
        ly += prism.centerY;
        return Vec3(pose.x + lx * cosH - ly * sinH,
                    pose.y + lx * sinH + ly * cosH,
                    z + lz);
    };

    const int base = static_cast<int>(vertices.size());
    const float z0 = prism.baseZ;
    const float z1 = prism.baseZ + prism.height;
    const float bw = prism.bottomHalfWidth;
    const float bd = prism.bottomHalfDepth;
    const float tw = prism.topHalfWidth;
    const float td = prism.topHalfDepth;

    vertices.push_back(place(-bw, -bd, z0));
    vertices.push_back(place( bw, -bd, z0));
    vertices.push_back(place( bw,  bd, z0));
    vertices.push_back(place(-bw,  bd, z0));
    vertices.push_back(place(-tw, -td, z1));
    vertices.push_back(place( tw, -td, z1));
    vertices.push_back(place( tw,  td, z1));
    vertices.push_back(place(-tw,  td, z1));

    for (const auto& corners : kPrismFaces) {
        faces.push_back(makeFace(base, corners));
    }
}

void generateBox(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                 float x, float y, float z, float width, float height, float depth) {
    PrismShape box;
    box.height = height;
    box.bottomHalfWidth = box.topHalfWidth = width * 0.5f;
    box.bottomHalfDepth = box.topHalfDepth = depth * 0.5f;

    Pose pose;
    pose.x = x;
    pose.y = y;
    appendPrism(vertices, faces, box, pose, z);
}

void generateTank(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                  const Pose& pose, float z, const TankDimensions& dims) {
    PrismShape hull;
    hull.height = dims.hullHeight;
    hull.bottomHalfWidth = dims.hullBottomWidth * 0.5f;
    hull.bottomHalfDepth = dims.hullBottomDepth * 0.5f;
    hull.topHalfWidth = dims.hullTopWidth * 0.5f;
    hull.topHalfDepth = dims.hullTopDepth * 0.5f;
    appendPrism(vertices, faces, hull, pose, z);

    PrismShape turret;
    turret.baseZ = dims.hullHeight;
    turret.height = dims.turretHeight;
    turret.bottomHalfWidth = turret.topHalfWidth = dims.turretWidth * 0.5f;
    turret.bottomHalfDepth = turret.topHalfDepth = dims.turretDepth * 0.5f;
    appendPrism(vertices, faces, turret, pose, z);

    const float halfThickness = dims.barrelThickness * 0.5f;
    PrismShape barrel;
    barrel.centerX = dims.turretWidth * 0.5f + dims.barrelLength * 0.5f;
    barrel.baseZ = dims.hullHeight + dims.turretHeight * 0.5f - halfThickness;
    barrel.height = dims.barrelThickness;
    barrel.bottomHalfWidth = barrel.topHalfWidth = dims.barrelLength * 0.5f;
    barrel.bottomHalfDepth = barrel.topHalfDepth = halfThickness;
    appendPrism(vertices, faces, barrel, pose, z);
}

void generateFaces(std::vector<Vec3>& vertices, std::vector<Face>& faces,
                   const RenderableEntity& entity) {
    switch (entity.shape.kind) {
        case ShapeKind::Box: {
            const BoxDimensions& b = entity.shape.box;
            generateBox(vertices, faces, entity.pose.x, entity.pose.y, entity.z,
                        b.width, b.height, b.depth);
            break;
        }
        case ShapeKind::Tank:
            generateTank(vertices, faces, entity.pose, entity.z, entity.shape.tank);
            break;
        case ShapeKind::Point:
            break;
    }
}

std::vector<Edge> uniqueEdges(const std::vector<Face>& faces) {
    std::vector<Edge> out;
    for (const Face& f : faces) {
        for (const Edge& e : f.edges) {
            Edge key{ std::min(e.a, e.b), std::max(e.a, e.b) };
            bool seen = std::any_of(out.begin(), out.end(), [&](const Edge& o) {
                return o.a == key.a && o.b == key.b;
            });
            if (!seen)
                out.push_back(key);
        }
    }
    return out;
}
