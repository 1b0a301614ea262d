// Visibility.h
#pragma once

#include <vector>
#include "RenderContext.h"

// Un-normalized; only its direction is used.
Vec3 faceNormal(const std::vector<Vec3>& vertices, const Face& face);
Vec3 faceCentroid(const std::vector<Vec3>& vertices, const Face& face);

// Edge-on faces (dot == 0) count as back-facing.
bool isFrontFacing(const Vec3& normal, const Vec3& centroid, const Vec3& eye);

// True only if every vertex of the face projects; there is no partial
// clipping, a face crossing the near or far plane is dropped whole.
bool faceInClipRange(const RenderContext& ctx, const std::vector<Vec3>& vertices,
                     const Face& face);

// Runs back-face and clip tests over faces generated into ctx.frame.vertices
// and appends the survivors, tagged with their centroid distance to the eye,
// to ctx.frame.faces. Returns the number of faces kept.
int collectVisibleFaces(RenderContext& ctx, const std::vector<Face>& faces);
