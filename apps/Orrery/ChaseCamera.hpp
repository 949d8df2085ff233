#pragma once
#include <SpaceRaster.h>

namespace Orrery
{
    /**
     * @brief Third person camera orbiting a moving target.
     * The eye sits at target + distance * ( cos(yaw) cos(pitch), sin(pitch), sin(yaw) cos(pitch) ).
     */
    class ChaseCamera
    {
    public:
        static constexpr float kMinDistance     = 1.5f;
        static constexpr float kMaxDistance     = 8.0f;
        static constexpr float kMouseSensitivity = 0.3f;
        static constexpr float kZoomSpeed       = 0.5f;

        ChaseCamera();

        // Mouse deltas in pixels; dragging up raises the camera
        void Rotate( float dx, float dy );
        void Zoom( float delta );

        // Moves the underlying camera behind the target. extraYaw (degrees) is added to the orbit yaw.
        void Follow( const glm::vec3& target, float extraYaw );

        float GetYaw() const { return m_yaw; }
        float GetPitch() const { return m_pitch; }
        float GetDistance() const { return m_distance; }

        const SpaceRaster::Camera& GetCamera() const { return m_camera; }

    private:
        float               m_yaw      = 62.0f;
        float               m_pitch    = 10.0f;
        float               m_distance = 5.0f;
        SpaceRaster::Camera m_camera;
    };
} // namespace Orrery
