// SceneRenderer.h
#pragma once

#include <vector>
#include "Geometry.h"
#include "Projector.h"
#include "RenderContext.h"

// True when both endpoints sit past the same viewport edge by more than the
// margin.
bool segmentOffscreen(const Viewport& viewport, float margin,
                      const ProjectedPoint& a, const ProjectedPoint& b);

// Projects and strokes one free-standing segment. Returns false if the
// segment was dropped by the near/far test or the screen-space cull.
bool drawSegment(RenderContext& ctx, const Vec3& p1, const Vec3& p2);
bool drawSegment(RenderContext& ctx, const Vec3& p1, const Vec3& p2,
                 const Color& color, float width);

// Lattice around the camera's current position. Returns the number of
// segments actually stroked.
int drawGroundGrid(RenderContext& ctx);

// Generates, culls and gathers the faces of every entity into
// ctx.frame.faces and the streaks of point-like entities into
// ctx.frame.segments. Clears the frame arena first.
void buildScene(RenderContext& ctx, const std::vector<RenderableEntity>& entities);

// Fills then strokes ctx.frame.faces in their current order.
void compositeFaces(RenderContext& ctx);

// Sorts ctx.frame.segments far to near and strokes them.
void flushSegments(RenderContext& ctx);

// Full face pass for one frame: build, global sort, composite, then the
// segment pass.
void drawScene(RenderContext& ctx, const std::vector<RenderableEntity>& entities);
