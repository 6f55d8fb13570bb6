#pragma once

#include "Map/LevelGeometry.h"
#include "RenderSettings.h"

//----------------------------------------------------------------------------------------------------------------------
// Where the viewer is and which way it faces.
// Angles are in radians, measured counter clockwise from the +x axis.
//----------------------------------------------------------------------------------------------------------------------
struct CameraPose {
    float x;
    float y;
    float z;            // Eye height
    float angle;        // Yaw
};

//----------------------------------------------------------------------------------------------------------------------
// A camera pose plus everything precomputed from it for one frame: the math mapping world space to screen columns and
// rows and back again.
//
// Notes:
//  (1) View space has 'depth' going into the screen along the view direction and 'lateral' going to the right.
//  (2) Screen coordinates are continuous: pixel column 'x' covers [x, x + 1) and its center is at x + 0.5.
//  (3) Pixels are square: horizontal and vertical projections use the same focal length.
//  (4) All depths are clamped to a small positive epsilon before dividing by them.
//----------------------------------------------------------------------------------------------------------------------
class Camera {
public:
    Camera(const CameraPose& pose, const RenderSettings& settings) noexcept;

    inline const CameraPose& getPose() const noexcept { return mPose; }
    inline float getCenterX() const noexcept { return mCenterX; }
    inline float getCenterY() const noexcept { return mCenterY; }
    inline float getFocalLength() const noexcept { return mFocalLength; }
    inline float getNearClipDepth() const noexcept { return mNearClipDepth; }
    inline float getDepthEpsilon() const noexcept { return mDepthEpsilon; }
    inline uint32_t getScreenWidth() const noexcept { return mScreenWidth; }
    inline uint32_t getScreenHeight() const noexcept { return mScreenHeight; }

    // The pixel row containing the horizon (where points at eye height project to)
    inline int32_t getHorizonRow() const noexcept { return (int32_t) mCenterY; }

    // Which side of a BSP partition line the camera is on (exactly on the line counts as the front)
    inline NodeSide sideOf(const Partition& line) const noexcept {
        return pointOnPartitionSide(line, mPose.x, mPose.y);
    }

    inline float clampDepth(const float depth) const noexcept {
        return (depth > mDepthEpsilon) ? depth : mDepthEpsilon;
    }

    // Transform a world xy point to view space
    inline void toViewSpace(const float x, const float y, float& outLateral, float& outDepth) const noexcept {
        const float dx = x - mPose.x;
        const float dy = y - mPose.y;
        outDepth = dx * mViewCos + dy * mViewSin;
        outLateral = dx * mViewSin - dy * mViewCos;
    }

    // Screen x for a view space point (depth is clamped)
    inline float projectLateral(const float lateral, const float depth) const noexcept {
        return mCenterX + lateral * mFocalLength / clampDepth(depth);
    }

    // Screen x for an angle relative to the view direction (positive angles are to the left) and the inverse
    float projectColumn(const float angleOffset) const noexcept;
    float columnToAngleOffset(const float screenX) const noexcept;

    // Screen space scale (pixels per world unit) at the given view depth
    inline float projectDistance(const float depth) const noexcept {
        return mFocalLength / clampDepth(depth);
    }

    // Screen y for a world height at the given view depth
    inline float projectHeight(const float z, const float depth) const noexcept {
        return mCenterY - (z - mPose.z) * projectDistance(depth);
    }

    // Find where the view ray through the given screen point hits the horizontal plane at height 'planeZ'.
    // Returns 'false' if the ray never hits the plane in front of the camera (horizon or plane on the wrong side).
    bool unprojectFloorPoint(
        const float screenX,
        const float screenY,
        const float planeZ,
        float& outWorldX,
        float& outWorldY
    ) const noexcept;

    // View depth of the plane at 'planeZ' along the given screen row, or a value <= 0 if not visible from that row
    float getPlaneDepthForRow(const float screenY, const float planeZ) const noexcept;

    // World space movement for a single step of lateral view space: used to step along a span
    inline float getRightX() const noexcept { return mViewSin; }
    inline float getRightY() const noexcept { return -mViewCos; }
    inline float getForwardX() const noexcept { return mViewCos; }
    inline float getForwardY() const noexcept { return mViewSin; }

private:
    CameraPose  mPose;
    float       mViewCos;           // Cosine and sine of the view angle
    float       mViewSin;
    float       mCenterX;           // Screen center
    float       mCenterY;
    float       mFocalLength;       // Distance to a projection plane which is 1 pixel per world unit
    float       mNearClipDepth;
    float       mDepthEpsilon;
    uint32_t    mScreenWidth;
    uint32_t    mScreenHeight;
};
