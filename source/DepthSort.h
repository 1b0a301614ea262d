// DepthSort.h
#pragma once

#include <vector>
#include "RenderContext.h"

// Farthest first. Order among equal distances is unspecified.
void sortFarToNear(std::vector<SceneFace>& faces);
void sortFarToNear(std::vector<Segment3D>& segments);
