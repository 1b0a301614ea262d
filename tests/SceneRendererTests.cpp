// SceneRendererTests.cpp
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "Projector.h"
#include "RecordingSurface.h"
#include "SceneRenderer.h"

namespace {

// Eye at (x, y, 20) facing +x, drawing into the recorder.
RenderContext makeContext(RecordingSurface& surface, float x = 0.0f, float y = 0.0f) {
    RenderContext ctx;
    ctx.surface = &surface;
    Pose pose;
    pose.x = x;
    pose.y = y;
    syncCamera(ctx.camera, pose);
    return ctx;
}

RenderableEntity box(float x, float y) {
    RenderableEntity e;
    e.pose.x = x;
    e.pose.y = y;
    e.shape.kind = ShapeKind::Box;
    return e;
}

RenderableEntity streak(float x, float y, float alpha) {
    RenderableEntity e;
    e.pose.x = x;
    e.pose.y = y;
    e.pose.heading = kPi * 0.5f;
    e.z = 5.0f;
    e.alpha = alpha;
    e.shape.kind = ShapeKind::Point;
    return e;
}

ProjectedPoint at(float x, float y) {
    ProjectedPoint p;
    p.x = x;
    p.y = y;
    return p;
}

bool sameColor(const Color& a, const Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

}

TEST(SegmentCull, SameSideOffscreenSegmentsAreCulled) {
    Viewport vp;
    EXPECT_TRUE(segmentOffscreen(vp, 50.0f, at(-60.0f, 10.0f), at(-500.0f, 300.0f)));
    EXPECT_TRUE(segmentOffscreen(vp, 50.0f, at(900.0f, 10.0f), at(851.0f, 300.0f)));
    EXPECT_TRUE(segmentOffscreen(vp, 50.0f, at(100.0f, -51.0f), at(700.0f, -80.0f)));
    EXPECT_TRUE(segmentOffscreen(vp, 50.0f, at(100.0f, 700.0f), at(700.0f, 651.0f)));
}

TEST(SegmentCull, SegmentsTouchingTheMarginedViewportAreKept) {
    Viewport vp;
    EXPECT_FALSE(segmentOffscreen(vp, 50.0f, at(-40.0f, 10.0f), at(-500.0f, 300.0f)));
    EXPECT_FALSE(segmentOffscreen(vp, 50.0f, at(-500.0f, 300.0f), at(1300.0f, 300.0f)));
    EXPECT_FALSE(segmentOffscreen(vp, 50.0f, at(-100.0f, -100.0f), at(900.0f, 700.0f)));
    EXPECT_FALSE(segmentOffscreen(vp, 50.0f, at(400.0f, 300.0f), at(410.0f, 310.0f)));
}

TEST(DrawSegment, VisibleSegmentIsStrokedOnceInAccent) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    EXPECT_TRUE(drawSegment(ctx, Vec3(100.0f, -10.0f, 0.0f), Vec3(100.0f, 10.0f, 0.0f)));
    ASSERT_EQ(surface.calls.size(), 1u);
    EXPECT_EQ(surface.calls[0].kind, DrawCall::Kind::Stroke);
    EXPECT_TRUE(sameColor(surface.calls[0].color, ctx.style.accent));
    EXPECT_FLOAT_EQ(surface.calls[0].width, ctx.style.lineWidth);
}

TEST(DrawSegment, DroppedSegmentsIssueNoDrawCall) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    // One endpoint behind the eye.
    EXPECT_FALSE(drawSegment(ctx, Vec3(-5.0f, 0.0f, 0.0f), Vec3(100.0f, 0.0f, 0.0f)));
    // Both endpoints far off the left edge.
    EXPECT_FALSE(drawSegment(ctx, Vec3(100.0f, 500.0f, 20.0f), Vec3(100.0f, 600.0f, 20.0f)));
    // Beyond the far plane.
    EXPECT_FALSE(drawSegment(ctx, Vec3(1500.0f, 0.0f, 0.0f), Vec3(1600.0f, 0.0f, 0.0f)));
    EXPECT_TRUE(surface.calls.empty());

    ctx.surface = nullptr;
    EXPECT_FALSE(drawSegment(ctx, Vec3(100.0f, -10.0f, 0.0f), Vec3(100.0f, 10.0f, 0.0f)));
}

TEST(GroundGrid, StrokesOnlyOnscreenSegmentsInGridStyle) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    const int drawn = drawGroundGrid(ctx);
    EXPECT_GT(drawn, 0);
    ASSERT_EQ(static_cast<int>(surface.calls.size()), drawn);
    for (const DrawCall& call : surface.calls) {
        EXPECT_EQ(call.kind, DrawCall::Kind::Stroke);
        EXPECT_TRUE(sameColor(call.color, ctx.style.grid));
        EXPECT_FLOAT_EQ(call.width, ctx.style.gridLineWidth);
        EXPECT_FALSE(segmentOffscreen(ctx.viewport, ctx.segmentMargin,
                                      at(call.points[0].x, call.points[0].y),
                                      at(call.points[1].x, call.points[1].y)));
    }
}

TEST(GroundGrid, FollowsTheCamera) {
    RecordingSurface atOrigin;
    RenderContext ctxA = makeContext(atOrigin);
    const int countA = drawGroundGrid(ctxA);

    // Moved by whole grid steps the lattice looks identical.
    RecordingSurface moved;
    RenderContext ctxB = makeContext(moved, 1000.0f, -2000.0f);
    const int countB = drawGroundGrid(ctxB);

    EXPECT_GT(countA, 0);
    EXPECT_EQ(countA, countB);
}

TEST(GroundGrid, SkippingAlternateLinesDrawsFewerSegments) {
    RecordingSurface sparse;
    RenderContext ctxA = makeContext(sparse);
    const int sparseCount = drawGroundGrid(ctxA);

    RecordingSurface dense;
    RenderContext ctxB = makeContext(dense);
    ctxB.grid.skipAlternate = false;
    const int denseCount = drawGroundGrid(ctxB);

    EXPECT_GT(denseCount, sparseCount);
}

TEST(GroundGrid, InvalidSettingsDrawNothing) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);
    ctx.grid.radius = 0.0f;
    EXPECT_EQ(drawGroundGrid(ctx), 0);
    EXPECT_TRUE(surface.calls.empty());
}

TEST(DrawScene, NearFaceIsCompositedAfterFarFace) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    // Listed near first; the global sort must reverse them.
    std::vector<RenderableEntity> entities{ box(100.0f, 0.0f), box(300.0f, 0.0f) };
    drawScene(ctx, entities);

    ASSERT_EQ(surface.calls.size(), 10u);
    ASSERT_EQ(surface.calls[0].kind, DrawCall::Kind::Fill);
    ASSERT_EQ(surface.calls[5].kind, DrawCall::Kind::Fill);

    const float farWidth = surface.calls[0].maxX() - surface.calls[0].minX();
    const float nearWidth = surface.calls[5].maxX() - surface.calls[5].minX();
    EXPECT_LT(farWidth, nearWidth);
}

TEST(DrawScene, EachFaceIsFilledThenStroked) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);
    ctx.camera.z = 60.0f;

    std::vector<RenderableEntity> entities{ box(150.0f, 40.0f) };
    drawScene(ctx, entities);

    const int fills = surface.count(DrawCall::Kind::Fill);
    ASSERT_GT(fills, 1);
    ASSERT_EQ(surface.calls.size(), static_cast<size_t>(fills) * 5);
    for (size_t i = 0; i < surface.calls.size(); ++i) {
        const DrawCall& call = surface.calls[i];
        if (i % 5 == 0) {
            EXPECT_EQ(call.kind, DrawCall::Kind::Fill);
            EXPECT_TRUE(sameColor(call.color, ctx.style.background));
            EXPECT_EQ(call.points.size(), 4u);
        } else {
            EXPECT_EQ(call.kind, DrawCall::Kind::Stroke);
            EXPECT_TRUE(sameColor(call.color, ctx.style.accent));
        }
    }
}

TEST(DrawScene, PointEntitiesBecomeFadedStreaksAfterTheFaces) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    std::vector<RenderableEntity> entities{ streak(100.0f, 0.0f, 0.5f), box(300.0f, 0.0f) };
    drawScene(ctx, entities);

    ASSERT_EQ(surface.calls.size(), 6u);
    EXPECT_EQ(surface.calls[0].kind, DrawCall::Kind::Fill);
    const DrawCall& last = surface.calls.back();
    EXPECT_EQ(last.kind, DrawCall::Kind::Stroke);
    EXPECT_FLOAT_EQ(last.color.a, ctx.style.accent.a * 0.5f);
    EXPECT_FLOAT_EQ(last.width, ctx.style.lineWidth);
}

TEST(DrawScene, SegmentsAreDrawnFarToNear) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);

    std::vector<RenderableEntity> entities{ streak(100.0f, 0.0f, 1.0f), streak(300.0f, 0.0f, 1.0f) };
    drawScene(ctx, entities);

    ASSERT_EQ(surface.calls.size(), 2u);
    const float first = std::fabs(surface.calls[0].points[1].x - surface.calls[0].points[0].x);
    const float second = std::fabs(surface.calls[1].points[1].x - surface.calls[1].points[0].x);
    EXPECT_LT(first, second);
}

TEST(DrawScene, FrameArenaIsRebuiltEachFrame) {
    RecordingSurface surface;
    RenderContext ctx = makeContext(surface);
    std::vector<RenderableEntity> entities{ box(100.0f, 0.0f), streak(80.0f, 0.0f, 1.0f) };

    drawScene(ctx, entities);
    const size_t faces = ctx.frame.faces.size();
    const size_t vertices = ctx.frame.vertices.size();
    const size_t segments = ctx.frame.segments.size();

    drawScene(ctx, entities);
    EXPECT_EQ(ctx.frame.faces.size(), faces);
    EXPECT_EQ(ctx.frame.vertices.size(), vertices);
    EXPECT_EQ(ctx.frame.segments.size(), segments);
    EXPECT_EQ(surface.calls.size(), 2 * (faces * 5 + segments));
}
