#include "Renderer_Internal.h"

#include "Map/LevelGeometry.h"
#include "Textures.h"
#include <algorithm>
#include <cmath>

BEGIN_NAMESPACE(Renderer)

// Screen y values are kept within this range before converting to rows, so very close walls can't overflow an int
static constexpr float MAX_SCREEN_Y_MAGNITUDE = 32768.0f;

//----------------------------------------------------------------------------------------------------------------------
// Notes a texture reference for a seg or plane: returns the texture height (which for a missing texture is the height
// of the placeholder that will be drawn instead).
//----------------------------------------------------------------------------------------------------------------------
static float useTexture(const TextureBank& textures, const uint32_t texId, FrameStats& stats) noexcept {
    if (!textures.contains(texId)) {
        ++stats.numMissingTextures;
    }

    return (float) textures.lookup(texId).data.height;
}

int32_t screenYToRow(const float screenY) noexcept {
    const float clampedY = FMath::clamp(screenY, -MAX_SCREEN_Y_MAGNITUDE, MAX_SCREEN_Y_MAGNITUDE);
    return (int32_t) std::ceil(clampedY - 0.5f);
}

void getSegColumnHit(
    const SegDrawInfo& info,
    const Camera& camera,
    const int32_t x,
    float& outT,
    float& outDepth
) noexcept {
    // The view ray through the column center is all points where: lateral = k * depth.
    // Solve for where the seg line 'p1 + t * (p2 - p1)' meets it.
    const float k = ((float) x + 0.5f - camera.getCenterX()) / camera.getFocalLength();
    const float dLateral = info.p2.lateral - info.p1.lateral;
    const float dDepth = info.p2.depth - info.p1.depth;
    const float denom = dLateral - k * dDepth;

    float t;

    if (std::abs(denom) > 1e-6f) {
        t = (k * info.p1.depth - info.p1.lateral) / denom;
    } else {
        t = 0.5f;   // Ray parallel to the seg: only happens for edge on segs which cover no columns anyway
    }

    t = FMath::clamp(t, 0.0f, 1.0f);
    outT = t;
    outDepth = camera.clampDepth(info.p1.depth + t * dDepth);
}

void prepareSegDraw(
    const RenderView& view,
    const Seg& seg,
    const ViewPoint& p1,
    const ViewPoint& p2,
    SegDrawInfo& info,
    FrameStats& stats
) noexcept {
    const LevelGeometry& level = view.level;
    const TextureBank& textures = view.textures;
    const float viewZ = view.camera.getPose().z;

    const SideDef& side = level.getSide(seg.sideDef);
    const LineDef& line = level.getLine(seg.lineDef);
    const Sector& front = level.getSector(seg.frontSector);
    const Sector* const pBack = (seg.isTwoSided()) ? &level.getSector(seg.backSector) : nullptr;

    info.pSeg = &seg;
    info.pFrontSector = &front;
    info.pBackSector = pBack;
    info.p1 = p1;
    info.p2 = p2;
    info.texUOffset = seg.offset + side.texXOffset;
    info.texVOffset = side.texYOffset;
    info.lightParams = getLightParams(front.lightLevel);
    info.lightMul = seg.lightMul;

    info.floorKey = VisplaneKey{ front.floorHeight, front.floorPic, front.lightLevel, true };
    info.ceilingKey = VisplaneKey{ front.ceilingHeight, front.ceilingPic, front.lightLevel, false };

    // Floors above the eye and ceilings below it face away from the camera
    const bool bFloorFacesCamera = (front.floorHeight < viewZ);
    const bool bCeilingFacesCamera = (front.ceilingHeight > viewZ);

    info.bDrawUpper = false;
    info.bDrawLower = false;
    info.bDrawMid = false;
    info.upperTexId = TextureBank::INVALID_TEX_ID;
    info.lowerTexId = TextureBank::INVALID_TEX_ID;
    info.midTexId = TextureBank::INVALID_TEX_ID;
    info.upperTexTopZ = 0.0f;
    info.lowerTexTopZ = 0.0f;
    info.midTexTopZ = 0.0f;

    if (!pBack) {
        // One sided line: a solid wall which marks the floor and ceiling all the way up to it
        info.bSolid = true;
        info.bMarkFloor = bFloorFacesCamera;
        info.bMarkCeiling = bCeilingFacesCamera;
        info.bDrawMid = true;
        info.midTexId = side.midTexture;

        // Middle texture pegs to the ceiling, unless lower unpegged where it sits on the floor
        const float texH = useTexture(textures, side.midTexture, stats);

        if (line.flags & ML_DONTPEGBOTTOM) {
            info.midTexTopZ = front.floorHeight + texH;
        } else {
            info.midTexTopZ = front.ceilingHeight;
        }
    }
    else {
        const Sector& back = *pBack;

        // Can't see through a back sector that has no vertical opening (e.g a closed door)
        const bool bBackClosed = (
            (back.ceilingHeight <= back.floorHeight) ||
            (back.ceilingHeight <= front.floorHeight) ||
            (back.floorHeight >= front.ceilingHeight)
        );

        info.bSolid = bBackClosed;

        if (bBackClosed) {
            info.bMarkFloor = bFloorFacesCamera;
            info.bMarkCeiling = bCeilingFacesCamera;
        } else {
            // Only need to mark planes where they change, otherwise the sector behind will mark them
            const bool bFloorChanges = (
                (back.floorHeight != front.floorHeight) ||
                (back.floorPic != front.floorPic) ||
                (back.lightLevel != front.lightLevel)
            );

            const bool bCeilingChanges = (
                (back.ceilingHeight != front.ceilingHeight) ||
                (back.ceilingPic != front.ceilingPic) ||
                (back.lightLevel != front.lightLevel)
            );

            info.bMarkFloor = (bFloorFacesCamera && bFloorChanges);
            info.bMarkCeiling = (bCeilingFacesCamera && bCeilingChanges);
        }

        // Upper wall: pegs its bottom to the back ceiling, unless upper unpegged where the top is at the front ceiling
        if (back.ceilingHeight < front.ceilingHeight) {
            info.bDrawUpper = true;
            info.upperTexId = side.topTexture;
            const float texH = useTexture(textures, side.topTexture, stats);

            if (line.flags & ML_DONTPEGTOP) {
                info.upperTexTopZ = front.ceilingHeight;
            } else {
                info.upperTexTopZ = back.ceilingHeight + texH;
            }
        }

        // Lower wall: pegs its top to the back floor, unless lower unpegged where it is anchored at the front ceiling
        if (back.floorHeight > front.floorHeight) {
            info.bDrawLower = true;
            info.lowerTexId = side.bottomTexture;
            useTexture(textures, side.bottomTexture, stats);

            if (line.flags & ML_DONTPEGBOTTOM) {
                info.lowerTexTopZ = front.ceilingHeight;
            } else {
                info.lowerTexTopZ = back.floorHeight;
            }
        }
    }

    if (info.bMarkFloor) {
        useTexture(textures, front.floorPic, stats);
    }

    if (info.bMarkCeiling) {
        useTexture(textures, front.ceilingPic, stats);
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Record that a plane covers the given rows in a column.
// Tries the plane used for the previous column first: if that plane can't take the column then a new one is found.
//----------------------------------------------------------------------------------------------------------------------
static void addPlaneColumn(
    const VisplaneKey& key,
    const int32_t x,
    const int32_t stopX,
    const int32_t rowTop,
    const int32_t rowBottom,
    uint32_t& cachedPlaneIdx,
    FrameContext& frame
) noexcept {
    if (rowTop > rowBottom)
        return;

    VisplanePool& visplanes = frame.visplanes;

    const bool bNeedNewPlane = (
        (cachedPlaneIdx >= visplanes.getNumLivePlanes()) ||
        (visplanes.getPlane(cachedPlaneIdx).key != key) ||
        (visplanes.getPlane(cachedPlaneIdx).cols[(uint32_t) x].isDefined())
    );

    if (bNeedNewPlane) {
        cachedPlaneIdx = visplanes.findPlane(key, x, stopX, frame.drawJobs);
    }

    Visplane& plane = visplanes.getPlane(cachedPlaneIdx);
    plane.cols[(uint32_t) x] = ScreenYPair{ (uint16_t) rowTop, (uint16_t) rowBottom };
}

//----------------------------------------------------------------------------------------------------------------------
// Emit a wall column job for one piece of wall in a column
//----------------------------------------------------------------------------------------------------------------------
static void emitWallPiece(
    const Camera& camera,
    const SegDrawInfo& info,
    const int32_t x,
    const int32_t rowTop,
    const int32_t rowBottom,
    const uint32_t texId,
    const float texTopZ,
    const float texU,
    const float scale,
    const float lightMul,
    FrameContext& frame
) noexcept {
    if (rowTop > rowBottom)
        return;

    // World height at the center of the first pixel, measured down from where the texture starts
    const float rowCenterY = (float) rowTop + 0.5f;
    const float worldZ = camera.getPose().z - (rowCenterY - camera.getCenterY()) / scale;

    WallColumnJob column = {};
    column.x = (uint16_t) x;
    column.yTop = (uint16_t) rowTop;
    column.yBottom = (uint16_t) rowBottom;
    column.texId = texId;
    column.texU = texU;
    column.texV = texTopZ - worldZ + info.texVOffset;
    column.texVStep = 1.0f / scale;
    column.lightMul = lightMul;

    frame.drawJobs.push_back(DrawJob::makeWallColumn(column));
    ++frame.stats.numWallColumns;
}

void emitSegColumns(
    const RenderView& view,
    const SegDrawInfo& info,
    const int32_t x1,
    const int32_t x2,
    FrameContext& frame
) noexcept {
    const Camera& camera = view.camera;
    const Sector& front = *info.pFrontSector;
    const Sector* const pBack = info.pBackSector;
    const float segLength = info.pSeg->length;
    ClipSpans& clipSpans = frame.clipSpans;

    // Planes used by the previous column: visplanes[numLive] is never valid so force a search on the first column
    uint32_t floorPlaneIdx = UINT32_MAX;
    uint32_t ceilingPlaneIdx = UINT32_MAX;

    for (int32_t x = x1; x <= x2; ++x) {
        const SegClip clip = clipSpans.getColumnClip(x);

        if (clip.isClosed())
            continue;

        const int32_t top = clip.top;
        const int32_t bottom = clip.bottom;

        // Where does the view ray for this column hit the seg and at what scale is the wall there?
        float t;
        float depth;
        getSegColumnHit(info, camera, x, t, depth);

        const float scale = camera.projectDistance(depth);
        const float texU = info.texUOffset + t * segLength;
        const float lightMul = info.lightParams.getLightMulForDist(depth) * info.lightMul;

        // Rows where the front sector ceiling ends and where the floor starts
        const int32_t ceilRow = screenYToRow(camera.projectHeight(front.ceilingHeight, depth));
        const int32_t floorRow = screenYToRow(camera.projectHeight(front.floorHeight, depth));

        // Shall I add the ceiling?
        if (info.bMarkCeiling) {
            addPlaneColumn(info.ceilingKey, x, x2, top + 1, std::min(ceilRow - 1, bottom - 1), ceilingPlaneIdx, frame);
        }

        // Shall I add the floor?
        if (info.bMarkFloor) {
            addPlaneColumn(info.floorKey, x, x2, std::max(floorRow, top + 1), bottom - 1, floorPlaneIdx, frame);
        }

        const int32_t wallTop = std::max(ceilRow, top + 1);
        const int32_t wallBottom = std::min(floorRow - 1, bottom - 1);

        if (!pBack) {
            emitWallPiece(camera, info, x, wallTop, wallBottom, info.midTexId, info.midTexTopZ, texU, scale, lightMul, frame);
            clipSpans.closeColumn(x);
            continue;
        }

        int32_t newTop = top;
        int32_t newBottom = bottom;

        if (info.bDrawUpper) {
            const int32_t backCeilRow = screenYToRow(camera.projectHeight(pBack->ceilingHeight, depth));
            // Stop at the front floor: a back sector entirely below it is closed and the floor plane owns those rows
            const int32_t upperBottom = std::min(backCeilRow - 1, wallBottom);
            emitWallPiece(camera, info, x, wallTop, upperBottom, info.upperTexId, info.upperTexTopZ, texU, scale, lightMul, frame);
            newTop = std::max(newTop, upperBottom);
        }
        else if (info.bMarkCeiling) {
            newTop = std::max(newTop, std::min(ceilRow - 1, bottom - 1));
        }

        if (info.bDrawLower) {
            const int32_t backFloorRow = screenYToRow(camera.projectHeight(pBack->floorHeight, depth));
            const int32_t lowerTop = std::max(backFloorRow, wallTop);
            emitWallPiece(camera, info, x, lowerTop, wallBottom, info.lowerTexId, info.lowerTexTopZ, texU, scale, lightMul, frame);
            newBottom = std::min(newBottom, lowerTop);
        }
        else if (info.bMarkFloor) {
            newBottom = std::min(newBottom, std::max(floorRow, top + 1));
        }

        if (info.bSolid) {
            clipSpans.closeColumn(x);
        } else {
            clipSpans.setColumnClip(x, newTop, newBottom);
        }
    }
}

END_NAMESPACE(Renderer)
