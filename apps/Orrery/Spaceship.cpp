#include "Spaceship.hpp"

#include "SolarSystem.hpp"

namespace Orrery
{
    using namespace SpaceRaster;

    Spaceship::Spaceship( const glm::vec3& position )
        : m_position( position )
        , m_rotation( 0.0f, glm::radians( 90.0f ), 0.0f )
        , m_mesh( ShapeGenerator::CreateSpaceship() )
    {
    }

    void Spaceship::MoveForward()
    {
        m_position.z -= m_speed;
        m_targetTiltZ = -0.15f;
    }

    void Spaceship::MoveBackward()
    {
        m_position.z += m_speed;
        m_targetTiltZ = 0.1f;
    }

    void Spaceship::MoveLeft()
    {
        m_position.x -= m_speed;
        m_targetTiltX     = -0.2f;
        m_targetCameraYaw = -15.0f;
    }

    void Spaceship::MoveRight()
    {
        m_position.x += m_speed;
        m_targetTiltX     = 0.2f;
        m_targetCameraYaw = 15.0f;
    }

    void Spaceship::UpdateAnimation()
    {
        m_tiltX += ( m_targetTiltX - m_tiltX ) * kLerpFactor;
        m_tiltZ += ( m_targetTiltZ - m_tiltZ ) * kLerpFactor;
        m_cameraYaw += ( m_targetCameraYaw - m_cameraYaw ) * kLerpFactor;

        m_targetTiltX *= kTargetDecay;
        m_targetTiltZ *= kTargetDecay;
        m_targetCameraYaw *= kTargetDecay;
    }

    glm::vec3 Spaceship::GetAnimatedRotation() const
    {
        return glm::vec3( m_rotation.x + m_tiltZ, m_rotation.y, m_rotation.z + m_tiltX );
    }

    glm::mat4 Spaceship::GetModelMatrix() const
    {
        return ComposeModelMatrix( m_position, m_scale, GetAnimatedRotation() );
    }
} // namespace Orrery
