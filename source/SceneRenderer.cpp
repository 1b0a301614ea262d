// SceneRenderer.cpp
#include "SceneRenderer.h"
#include "DepthSort.h"
#include "Visibility.h"

#include <cmath>

bool segmentOffscreen(const Viewport& viewport, float margin,
                      const ProjectedPoint& a, const ProjectedPoint& b) {
    const float minX = -margin;
    const float minY = -margin;
    const float maxX = static_cast<float>(viewport.width) + margin;
    const float maxY = static_cast<float>(viewport.height) + margin;

    if (a.x < minX && b.x < minX) return true;
    if (a.x > maxX && b.x > maxX) return true;
    if (a.y < minY && b.y < minY) return true;
    if (a.y > maxY && b.y > maxY) return true;
    return false;
}

bool drawSegment(RenderContext& ctx, const Vec3& p1, const Vec3& p2) {
    return drawSegment(ctx, p1, p2, ctx.style.accent, ctx.style.lineWidth);
}

bool drawSegment(RenderContext& ctx, const Vec3& p1, const Vec3& p2,
                 const Color& color, float width) {
    ProjectedPoint a;
    ProjectedPoint b;
    if (!project(ctx, p1, a) || !project(ctx, p2, b))
        return false;
    if (segmentOffscreen(ctx.viewport, ctx.segmentMargin, a, b))
        return false;
    if (!ctx.surface)
        return false;

    ctx.surface->strokeLine(a.x, a.y, b.x, b.y, color, width);
    return true;
}

int drawGroundGrid(RenderContext& ctx) {
    const GridSettings& grid = ctx.grid;
    if (grid.spacing <= 0.0f || grid.radius <= 0.0f)
        return 0;

    const float step = grid.skipAlternate ? grid.spacing * 2.0f : grid.spacing;
    const float camX = ctx.camera.x;
    const float camY = ctx.camera.y;

    // Lines snap to world multiples of the step so they stay put while the
    // camera moves.
    const float startX = std::floor((camX - grid.radius) / step) * step;
    const float endX = std::ceil((camX + grid.radius) / step) * step;
    const float startY = std::floor((camY - grid.radius) / step) * step;
    const float endY = std::ceil((camY + grid.radius) / step) * step;

    const Color& color = ctx.style.grid;
    const float width = ctx.style.gridLineWidth;
    int drawn = 0;

    for (float x = startX; x <= endX; x += step) {
        for (float y = startY; y < endY; y += step) {
            if (drawSegment(ctx, Vec3(x, y, 0.0f), Vec3(x, y + step, 0.0f), color, width))
                ++drawn;
        }
    }
    for (float y = startY; y <= endY; y += step) {
        for (float x = startX; x < endX; x += step) {
            if (drawSegment(ctx, Vec3(x, y, 0.0f), Vec3(x + step, y, 0.0f), color, width))
                ++drawn;
        }
    }
    return drawn;
}

static void queuePointStreak(RenderContext& ctx, const RenderableEntity& e) {
    const float half = e.shape.pointLength * 0.5f;
    const float dx = std::cos(e.pose.heading) * half;
    const float dy = std::sin(e.pose.heading) * half;

    Segment3D seg;
    seg.a = Vec3(e.pose.x + dx, e.pose.y + dy, e.z);
    seg.b = Vec3(e.pose.x - dx, e.pose.y - dy, e.z);
    seg.color = ctx.style.accent;
    seg.color.a *= e.alpha;
    seg.width = ctx.style.lineWidth;
    const Vec3 eye(ctx.camera.x, ctx.camera.y, ctx.camera.z);
    seg.distance = distance3D((seg.a + seg.b) * 0.5f, eye);
    ctx.frame.segments.push_back(seg);
}

void buildScene(RenderContext& ctx, const std::vector<RenderableEntity>& entities) {
    ctx.frame.clear();

    for (const RenderableEntity& e : entities) {
        if (e.shape.kind == ShapeKind::Point) {
            queuePointStreak(ctx, e);
            continue;
        }
        ctx.frame.generated.clear();
        generateFaces(ctx.frame.vertices, ctx.frame.generated, e);
        collectVisibleFaces(ctx, ctx.frame.generated);
    }
}

static int cornerOf(const Face& face, int vertexIndex) {
    for (int i = 0; i < 4; ++i) {
        if (face.indices[i] == vertexIndex)
            return i;
    }
    return 0;
}

void compositeFaces(RenderContext& ctx) {
    if (!ctx.surface)
        return;

    const std::vector<Vec3>& vertices = ctx.frame.vertices;
    ScreenPoint poly[4];
    ProjectedPoint projected[4];

    for (const SceneFace& sf : ctx.frame.faces) {
        bool ok = true;
        for (int i = 0; i < 4 && ok; ++i) {
            ok = project(ctx, vertices[sf.face.indices[i]], projected[i]);
        }
        if (!ok)
            continue;

        for (int i = 0; i < 4; ++i) {
            poly[i].x = projected[i].x;
            poly[i].y = projected[i].y;
        }
        ctx.surface->fillPolygon(poly, 4, ctx.style.background);

        for (const Edge& edge : sf.face.edges) {
            const ProjectedPoint& a = projected[cornerOf(sf.face, edge.a)];
            const ProjectedPoint& b = projected[cornerOf(sf.face, edge.b)];
            ctx.surface->strokeLine(a.x, a.y, b.x, b.y, ctx.style.accent, ctx.style.lineWidth);
        }
    }
}

void flushSegments(RenderContext& ctx) {
    sortFarToNear(ctx.frame.segments);
    for (const Segment3D& seg : ctx.frame.segments) {
        drawSegment(ctx, seg.a, seg.b, seg.color, seg.width);
    }
}

void drawScene(RenderContext& ctx, const std::vector<RenderableEntity>& entities) {
    buildScene(ctx, entities);
    sortFarToNear(ctx.frame.faces);
    compositeFaces(ctx);
    flushSegments(ctx);
}
