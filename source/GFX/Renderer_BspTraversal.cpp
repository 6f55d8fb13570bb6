#include "Renderer_Internal.h"

#include "Map/LevelGeometry.h"
#include <algorithm>
#include <cmath>

//----------------------------------------------------------------------------------------------------------------------
// Module that handles traversing the BSP tree, so we can produce lists of things to draw.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// Clip a convex polygon in view space so that it only contains points at or beyond the given depth.
// The output must have room for at least one more point than the input.
//----------------------------------------------------------------------------------------------------------------------
static uint32_t clipPolygonToNearPlane(
    const ViewPoint* const pInPoints,
    const uint32_t numInPoints,
    const float nearDepth,
    ViewPoint* const pOutPoints
) noexcept {
    uint32_t numOutPoints = 0;

    for (uint32_t i = 0; i < numInPoints; ++i) {
        const ViewPoint& cur = pInPoints[i];
        const ViewPoint& next = pInPoints[(i + 1) % numInPoints];
        const bool bCurInside = (cur.depth >= nearDepth);
        const bool bNextInside = (next.depth >= nearDepth);

        if (bCurInside) {
            pOutPoints[numOutPoints] = cur;
            ++numOutPoints;
        }

        // Crossing the plane? If so then add the point where the edge crosses:
        if (bCurInside != bNextInside) {
            const float t = (nearDepth - cur.depth) / (next.depth - cur.depth);
            pOutPoints[numOutPoints] = ViewPoint{ cur.lateral + t * (next.lateral - cur.lateral), nearDepth };
            ++numOutPoints;
        }
    }

    return numOutPoints;
}

//----------------------------------------------------------------------------------------------------------------------
// Project a view space point to screen x, kept within a little past the screen edges so it always converts to an int
//----------------------------------------------------------------------------------------------------------------------
static float projectToClampedScreenX(const Camera& camera, const ViewPoint& point) noexcept {
    const float screenX = camera.projectLateral(point.lateral, point.depth);
    const float maxScreenX = (float) camera.getScreenWidth() + 2.0f;
    return FMath::clamp(screenX, -2.0f, maxScreenX);
}

bool isBBoxVisible(const float bbox[BOXCOUNT], const Camera& camera, const ClipSpans& clipSpans) noexcept {
    if (clipSpans.isScreenFull())
        return false;

    // If the camera is inside the box then it is always in view
    const CameraPose& pose = camera.getPose();

    const bool bCameraInBox = (
        (pose.x >= bbox[BOXLEFT]) &&
        (pose.x <= bbox[BOXRIGHT]) &&
        (pose.y >= bbox[BOXBOTTOM]) &&
        (pose.y <= bbox[BOXTOP])
    );

    if (bCameraInBox)
        return true;

    // Makeup the 4 box points and transform to view space
    ViewPoint boxPoints[4];
    camera.toViewSpace(bbox[BOXLEFT], bbox[BOXTOP], boxPoints[0].lateral, boxPoints[0].depth);
    camera.toViewSpace(bbox[BOXRIGHT], bbox[BOXTOP], boxPoints[1].lateral, boxPoints[1].depth);
    camera.toViewSpace(bbox[BOXRIGHT], bbox[BOXBOTTOM], boxPoints[2].lateral, boxPoints[2].depth);
    camera.toViewSpace(bbox[BOXLEFT], bbox[BOXBOTTOM], boxPoints[3].lateral, boxPoints[3].depth);

    // Clip against the near plane: if nothing is left then the box is entirely behind the camera
    ViewPoint clippedPoints[8];
    const uint32_t numClippedPoints = clipPolygonToNearPlane(boxPoints, 4, camera.getNearClipDepth(), clippedPoints);

    if (numClippedPoints == 0)
        return false;

    // Get the screen x range of what is left
    float minScreenX = projectToClampedScreenX(camera, clippedPoints[0]);
    float maxScreenX = minScreenX;

    for (uint32_t i = 1; i < numClippedPoints; ++i) {
        const float screenX = projectToClampedScreenX(camera, clippedPoints[i]);
        minScreenX = std::min(minScreenX, screenX);
        maxScreenX = std::max(maxScreenX, screenX);
    }

    // Round outwards so the range always contains every column a seg in the box could produce
    const int32_t screenW = (int32_t) camera.getScreenWidth();
    int32_t x1 = (int32_t) std::floor(minScreenX - 0.5f);
    int32_t x2 = (int32_t) std::ceil(maxScreenX - 0.5f);

    if ((x2 < 0) || (x1 >= screenW))
        return false;

    x1 = std::max(x1, 0);
    x2 = std::min(x2, screenW - 1);

    return (!clipSpans.isFullyOccluded(x1, x2));
}

void addSegToFrame(const RenderView& view, const Seg& seg, FrameContext& frame) noexcept {
    const Camera& camera = view.camera;
    const CameraPose& pose = camera.getPose();

    // Back face cull: the camera must be strictly in front of the seg (on its right side) to see it
    const float segDx = seg.v2.x - seg.v1.x;
    const float segDy = seg.v2.y - seg.v1.y;
    const float cross = (pose.x - seg.v1.x) * segDy - (pose.y - seg.v1.y) * segDx;

    if (cross <= 0.0f)
        return;

    // Transform the seg to view space and clip it against the near plane
    ViewPoint p1;
    ViewPoint p2;
    camera.toViewSpace(seg.v1.x, seg.v1.y, p1.lateral, p1.depth);
    camera.toViewSpace(seg.v2.x, seg.v2.y, p2.lateral, p2.depth);

    const float nearDepth = camera.getNearClipDepth();

    if ((p1.depth < nearDepth) && (p2.depth < nearDepth))
        return;

    ViewPoint clippedP1 = p1;
    ViewPoint clippedP2 = p2;

    if (p1.depth < nearDepth) {
        const float t = (nearDepth - p1.depth) / (p2.depth - p1.depth);
        clippedP1.lateral = p1.lateral + t * (p2.lateral - p1.lateral);
        clippedP1.depth = nearDepth;
    }
    else if (p2.depth < nearDepth) {
        const float t = (nearDepth - p2.depth) / (p1.depth - p2.depth);
        clippedP2.lateral = p2.lateral + t * (p1.lateral - p2.lateral);
        clippedP2.depth = nearDepth;
    }

    // Project to screen columns: a front facing seg always goes from left to right.
    // A column is covered if its center is within the projected seg.
    const float screenX1 = projectToClampedScreenX(camera, clippedP1);
    const float screenX2 = projectToClampedScreenX(camera, clippedP2);

    if (screenX1 >= screenX2)
        return;

    const int32_t screenW = (int32_t) camera.getScreenWidth();
    const int32_t x1 = std::max((int32_t) std::ceil(screenX1 - 0.5f), 0);
    const int32_t x2 = std::min((int32_t) std::ceil(screenX2 - 0.5f) - 1, screenW - 1);

    if (x1 > x2)
        return;

    // Only bother with the parts which are not already hidden by solid walls
    frame.clipSpans.clipToVisible(x1, x2, frame.visibleRanges);

    if (frame.visibleRanges.empty())
        return;

    SegDrawInfo info;
    prepareSegDraw(view, seg, p1, p2, info, frame.stats);

    for (const ClipRange& range : frame.visibleRanges) {
        emitSegColumns(view, info, range.first, range.last, frame);
    }

    ++frame.stats.numSegsDrawn;

    // Nothing behind a solid wall can be seen
    if (info.bSolid) {
        frame.clipSpans.markSolid(x1, x2);
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Pass all walls in a subsector to the rendering engine
//----------------------------------------------------------------------------------------------------------------------
static void addSubsectorToFrame(const RenderView& view, const uint32_t subsectorIdx, FrameContext& frame) noexcept {
    frame.stats.subsectorOrder.push_back(subsectorIdx);

    for (const Seg& seg : view.level.getSubsectorSegs(subsectorIdx)) {
        addSegToFrame(view, seg, frame);
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Traverse the BSP tree starting from a tree node (or subsector) and recursively subdivide if needed.
// The side of the partition that the camera is on is drawn first: everything there is closer than anything on the
// other side, so the tree gives a front to back ordering.
//----------------------------------------------------------------------------------------------------------------------
static void addBspChildToFrame(const RenderView& view, const BspChild child, FrameContext& frame) noexcept {
    if (frame.clipSpans.isScreenFull())     // Everything hidden already?
        return;

    if (child.isLeaf()) {
        addSubsectorToFrame(view, child.index, frame);
        return;
    }

    const BspNode& node = view.level.getNode(child.index);
    const NodeSide frontSide = view.camera.sideOf(node.line);
    const NodeSide backSide = (frontSide == NodeSide::Front) ? NodeSide::Back : NodeSide::Front;

    // Process the side closest to the camera
    addBspChildToFrame(view, node.children[(uint32_t) frontSide], frame);

    // Visit the far side only if its bounding box could be seen
    if (isBBoxVisible(node.bbox[(uint32_t) backSide], view.camera, frame.clipSpans)) {
        addBspChildToFrame(view, node.children[(uint32_t) backSide], frame);
    } else {
        ++frame.stats.numCulledNodes;
    }
}

void doBspTraversal(const RenderView& view, FrameContext& frame) noexcept {
    addBspChildToFrame(view, view.level.getRoot(), frame);
}

END_NAMESPACE(Renderer)
