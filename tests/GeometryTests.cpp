// GeometryTests.cpp
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "Geometry.h"
#include "Visibility.h"

namespace {

Vec3 centerOf(const std::vector<Vec3>& vertices, size_t first, size_t count) {
    Vec3 sum;
    for (size_t i = first; i < first + count; ++i)
        sum += vertices[i];
    return sum * (1.0f / static_cast<float>(count));
}

// Every face of every 8-vertex prism must point away from that prism's
// center.
void expectOutwardNormals(const std::vector<Vec3>& vertices, const std::vector<Face>& faces) {
    ASSERT_EQ(faces.size() % 6, 0u);
    for (size_t f = 0; f < faces.size(); ++f) {
        const size_t prism = f / 6;
        const Vec3 center = centerOf(vertices, prism * 8, 8);
        const Vec3 normal = faceNormal(vertices, faces[f]);
        const Vec3 outward = faceCentroid(vertices, faces[f]) - center;
        EXPECT_GT(dot(normal, outward), 0.0f) << "face " << f;
    }
}

}

TEST(Geometry, BoxHasSixFacesAndTwelveEdges) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    generateBox(vertices, faces, 10.0f, 20.0f, 0.0f, 40.0f, 30.0f, 20.0f);

    EXPECT_EQ(vertices.size(), 8u);
    EXPECT_EQ(faces.size(), 6u);
    EXPECT_EQ(uniqueEdges(faces).size(), 12u);
}

TEST(Geometry, DegenerateBoxKeepsItsTopology) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    generateBox(vertices, faces, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f);

    EXPECT_EQ(faces.size(), 6u);
    EXPECT_EQ(uniqueEdges(faces).size(), 12u);
}

TEST(Geometry, BoxSitsOnItsBaseAndIsCenteredOnItsPosition) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    generateBox(vertices, faces, 100.0f, 50.0f, 5.0f, 40.0f, 12.0f, 20.0f);

    float minZ = vertices[0].z, maxZ = vertices[0].z;
    float minX = vertices[0].x, maxX = vertices[0].x;
    float minY = vertices[0].y, maxY = vertices[0].y;
    for (const Vec3& v : vertices) {
        minZ = std::min(minZ, v.z); maxZ = std::max(maxZ, v.z);
        minX = std::min(minX, v.x); maxX = std::max(maxX, v.x);
        minY = std::min(minY, v.y); maxY = std::max(maxY, v.y);
    }
    EXPECT_FLOAT_EQ(minZ, 5.0f);
    EXPECT_FLOAT_EQ(maxZ, 17.0f);
    EXPECT_FLOAT_EQ(minX, 80.0f);
    EXPECT_FLOAT_EQ(maxX, 120.0f);
    EXPECT_FLOAT_EQ(minY, 40.0f);
    EXPECT_FLOAT_EQ(maxY, 60.0f);
}

TEST(Geometry, BoxNormalsPointOutward) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    generateBox(vertices, faces, -30.0f, 70.0f, 0.0f, 40.0f, 40.0f, 40.0f);
    expectOutwardNormals(vertices, faces);
}

TEST(Geometry, FaceEdgesFollowTheFaceOutline) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    generateBox(vertices, faces, 0.0f, 0.0f, 0.0f, 10.0f, 10.0f, 10.0f);

    for (const Face& f : faces) {
        for (int i = 0; i < 4; ++i) {
            EXPECT_EQ(f.edges[i].a, f.indices[i]);
            EXPECT_EQ(f.edges[i].b, f.indices[(i + 1) % 4]);
        }
    }
}

TEST(Geometry, TankIsHullTurretAndBarrel) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    Pose pose;
    pose.x = 200.0f;
    pose.y = 300.0f;
    pose.heading = 0.7f;
    generateTank(vertices, faces, pose, 0.0f, TankDimensions{});

    EXPECT_EQ(vertices.size(), 24u);
    EXPECT_EQ(faces.size(), 18u);
    EXPECT_EQ(uniqueEdges(faces).size(), 36u);
    expectOutwardNormals(vertices, faces);
}

TEST(Geometry, TankBarrelPointsAlongHeading) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    Pose pose;
    pose.x = 50.0f;
    pose.y = -20.0f;
    pose.heading = 2.0f;
    const TankDimensions dims;
    generateTank(vertices, faces, pose, 0.0f, dims);

    const float fx = std::cos(pose.heading);
    const float fy = std::sin(pose.heading);
    float reach = -1e9f;
    for (const Vec3& v : vertices) {
        reach = std::max(reach, (v.x - pose.x) * fx + (v.y - pose.y) * fy);
    }
    EXPECT_NEAR(reach, dims.turretWidth * 0.5f + dims.barrelLength, 1e-3f);

    // Barrel vertices are the last prism.
    for (size_t i = 16; i < 24; ++i) {
        EXPECT_GT(vertices[i].z, dims.hullHeight);
        EXPECT_LT(vertices[i].z, dims.hullHeight + dims.turretHeight);
    }
}

TEST(Geometry, HullTopIsNarrowerThanItsBase) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;
    const TankDimensions dims;
    generateTank(vertices, faces, Pose{}, 0.0f, dims);

    EXPECT_FLOAT_EQ(vertices[1].x - vertices[0].x, dims.hullBottomWidth);
    EXPECT_FLOAT_EQ(vertices[5].x - vertices[4].x, dims.hullTopWidth);
    EXPECT_FLOAT_EQ(vertices[4].z, dims.hullHeight);
}

TEST(Geometry, GenerateFacesDispatchesOnShapeKind) {
    std::vector<Vec3> vertices;
    std::vector<Face> faces;

    RenderableEntity point;
    point.shape.kind = ShapeKind::Point;
    generateFaces(vertices, faces, point);
    EXPECT_TRUE(vertices.empty());
    EXPECT_TRUE(faces.empty());

    RenderableEntity box;
    box.shape.kind = ShapeKind::Box;
    generateFaces(vertices, faces, box);
    EXPECT_EQ(faces.size(), 6u);

    RenderableEntity tank;
    tank.shape.kind = ShapeKind::Tank;
    generateFaces(vertices, faces, tank);
    EXPECT_EQ(faces.size(), 24u);
    EXPECT_EQ(vertices.size(), 32u);

    // Appended faces index past the vertices that were already there.
    for (size_t f = 6; f < faces.size(); ++f) {
        for (int idx : faces[f].indices) {
            EXPECT_GE(idx, 8);
            EXPECT_LT(idx, 32);
        }
    }
}
