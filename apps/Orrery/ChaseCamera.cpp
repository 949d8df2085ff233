#include "ChaseCamera.hpp"

namespace Orrery
{
    using namespace SpaceRaster;

    ChaseCamera::ChaseCamera()
        : m_camera( glm::vec3( 0.0f ), 0.0f, 0.0f, ProjectionConfig() )
    {
    }

    void ChaseCamera::Rotate( float dx, float dy )
    {
        m_yaw += dx * kMouseSensitivity;
        m_pitch = glm::clamp( m_pitch - dy * kMouseSensitivity, -Camera::kPitchLimit, Camera::kPitchLimit );
    }

    void ChaseCamera::Zoom( float delta )
    {
        m_distance = glm::clamp( m_distance - delta * kZoomSpeed, kMinDistance, kMaxDistance );
    }

    void ChaseCamera::Follow( const glm::vec3& target, float extraYaw )
    {
        // Camera::Orbit places the eye opposite its view direction, so look back along the offset
        m_camera.SetRotation( m_yaw + extraYaw + 180.0f, -m_pitch );
        m_camera.Orbit( target, m_distance );
    }
} // namespace Orrery
