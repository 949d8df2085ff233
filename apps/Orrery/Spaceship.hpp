#pragma once
#include <SpaceRaster.h>

namespace Orrery
{
    /**
     * @brief Player ship. Moves on the xz plane and banks towards the direction of travel.
     * Tilt and camera yaw ease towards their targets (lerp 0.1) while the targets decay back to neutral (x0.9 per update).
     */
    class Spaceship
    {
    public:
        static constexpr float kLerpFactor  = 0.1f;
        static constexpr float kTargetDecay = 0.9f;

        explicit Spaceship( const glm::vec3& position = glm::vec3( 6.0f, 4.0f, 9.0f ) );

        void MoveForward();
        void MoveBackward();
        void MoveLeft();
        void MoveRight();

        // Once per frame, after the moves
        void UpdateAnimation();

        glm::vec3 GetAnimatedRotation() const;
        glm::mat4 GetModelMatrix() const;

        const glm::vec3& GetPosition() const { return m_position; }
        float            GetCameraYaw() const { return m_cameraYaw; } // Degrees
        float            GetTiltX() const { return m_tiltX; }
        float            GetTiltZ() const { return m_tiltZ; }
        const SpaceRaster::Mesh& GetMesh() const { return m_mesh; }

    private:
        glm::vec3 m_position;
        glm::vec3 m_rotation; // Radians
        float     m_speed = 0.15f;
        float     m_scale = 0.3f;

        float m_tiltX           = 0.0f; // Roll
        float m_tiltZ           = 0.0f; // Pitch
        float m_targetTiltX     = 0.0f;
        float m_targetTiltZ     = 0.0f;
        float m_cameraYaw       = 0.0f;
        float m_targetCameraYaw = 0.0f;

        SpaceRaster::Mesh m_mesh;
    };
} // namespace Orrery
