#include "Camera.h"

#include <cmath>

Camera::Camera(const CameraPose& pose, const RenderSettings& settings) noexcept
    : mPose(pose)
    , mViewCos(std::cos(pose.angle))
    , mViewSin(std::sin(pose.angle))
    , mCenterX((float) settings.screenWidth * 0.5f)
    , mCenterY((float) settings.screenHeight * 0.5f)
    , mFocalLength(0.0f)
    , mNearClipDepth(settings.nearClipDepth)
    , mDepthEpsilon(settings.depthEpsilon)
    , mScreenWidth(settings.screenWidth)
    , mScreenHeight(settings.screenHeight)
{
    ASSERT(settings.fieldOfView > 0.0f && settings.fieldOfView < FMath::ANGLE_180<float>);
    ASSERT(settings.depthEpsilon > 0.0f);

    // The field of view spans the whole screen width
    mFocalLength = mCenterX / std::tan(settings.fieldOfView * 0.5f);

    // Clipping at a depth smaller than the clamp value would let degenerate depths through
    if (mNearClipDepth < mDepthEpsilon) {
        mNearClipDepth = mDepthEpsilon;
    }
}

float Camera::projectColumn(const float angleOffset) const noexcept {
    return mCenterX - std::tan(angleOffset) * mFocalLength;
}

float Camera::columnToAngleOffset(const float screenX) const noexcept {
    return std::atan((mCenterX - screenX) / mFocalLength);
}

float Camera::getPlaneDepthForRow(const float screenY, const float planeZ) const noexcept {
    // Rows below the horizon look down and rows above look up.
    // By similar triangles: depth = height difference * focal length / rows from the horizon.
    const float rowsFromHorizon = screenY - mCenterY;

    if (std::abs(rowsFromHorizon) < mDepthEpsilon)
        return 0.0f;

    return (mPose.z - planeZ) * mFocalLength / rowsFromHorizon;
}

bool Camera::unprojectFloorPoint(
    const float screenX,
    const float screenY,
    const float planeZ,
    float& outWorldX,
    float& outWorldY
) const noexcept {
    const float depth = getPlaneDepthForRow(screenY, planeZ);

    if (depth <= 0.0f)
        return false;

    const float lateral = (screenX - mCenterX) * depth / mFocalLength;
    outWorldX = mPose.x + mViewCos * depth + mViewSin * lateral;
    outWorldY = mPose.y + mViewSin * depth - mViewCos * lateral;
    return true;
}
