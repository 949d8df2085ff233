#include "renderer/Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace SpaceRaster
{
    namespace
    {
        const glm::vec3 kWorldUp( 0.0f, 1.0f, 0.0f );
    }

    Camera::Camera( const glm::vec3& position, float yaw, float pitch, const ProjectionConfig& projection )
        : m_position( position )
        , m_target( 0.0f )
        , m_yaw( yaw )
        , m_pitch( glm::clamp( pitch, -kPitchLimit, kPitchLimit ) )
        , m_projection( projection )
    {
    }

    void Camera::SetRotation( float yaw, float pitch )
    {
        m_yaw   = yaw;
        m_pitch = glm::clamp( pitch, -kPitchLimit, kPitchLimit );
    }

    void Camera::ProcessKeyboard( CameraMovement direction, float dt )
    {
        float velocity = m_speed * dt;
        switch( direction )
        {
            case CameraMovement::FORWARD:
                m_position += GetFront() * velocity;
                break;
            case CameraMovement::BACKWARD:
                m_position -= GetFront() * velocity;
                break;
            case CameraMovement::LEFT:
                m_position -= GetRight() * velocity;
                break;
            case CameraMovement::RIGHT:
                m_position += GetRight() * velocity;
                break;
            case CameraMovement::UP:
                m_position += kWorldUp * velocity;
                break;
            case CameraMovement::DOWN:
                m_position -= kWorldUp * velocity;
                break;
        }
        m_hasTarget = false;
    }

    void Camera::ProcessMouse( float xOffset, float yOffset )
    {
        SetRotation( m_yaw + xOffset * m_sensitivity, m_pitch + yOffset * m_sensitivity );
    }

    void Camera::Orbit( const glm::vec3& target, float distance )
    {
        // Spherical coordinates around the target, the eye sits opposite the view direction
        m_position  = target - GetFront() * distance;
        m_target    = target;
        m_hasTarget = true;
    }

    glm::vec3 Camera::GetFront() const
    {
        float yaw   = glm::radians( m_yaw );
        float pitch = glm::radians( m_pitch );

        glm::vec3 front;
        front.x = cos( yaw ) * cos( pitch );
        front.y = sin( pitch );
        front.z = sin( yaw ) * cos( pitch );
        return glm::normalize( front );
    }

    glm::vec3 Camera::GetRight() const
    {
        return glm::normalize( glm::cross( GetFront(), kWorldUp ) );
    }

    glm::vec3 Camera::GetUp() const
    {
        return glm::normalize( glm::cross( GetRight(), GetFront() ) );
    }

    glm::mat4 Camera::GetViewMatrix() const
    {
        glm::vec3 center = m_hasTarget ? m_target : m_position + GetFront();
        return glm::lookAt( m_position, center, kWorldUp );
    }

    glm::mat4 Camera::GetProjectionMatrix( float aspectRatio ) const
    {
        // OpenGL clip conventions: depth in [-1, 1], y up. The rasterizer flips y itself.
        return glm::perspective( glm::radians( m_projection.fov ), aspectRatio, m_projection.nearClip, m_projection.farClip );
    }

    FrameSnapshot Camera::MakeSnapshot( const Viewport& viewport, float time ) const
    {
        FrameSnapshot snapshot;
        snapshot.view       = GetViewMatrix();
        snapshot.projection = GetProjectionMatrix( viewport.GetAspectRatio() );
        snapshot.eye        = m_position;
        snapshot.time       = time;
        return snapshot;
    }
} // namespace SpaceRaster
