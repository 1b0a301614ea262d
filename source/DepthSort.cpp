// DepthSort.cpp
#include "DepthSort.h"

#include <algorithm>

void sortFarToNear(std::vector<SceneFace>& faces) {
    std::sort(faces.begin(), faces.end(), [](const SceneFace& a, const SceneFace& b) {
        return a.distance > b.distance;
    });
}

void sortFarToNear(std::vector<Segment3D>& segments) {
    std::sort(segments.begin(), segments.end(), [](const Segment3D& a, const Segment3D& b) {
        return a.distance > b.distance;
    });
}
