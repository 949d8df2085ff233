#pragma once
#include "renderer/PipelineTypes.hpp"
#include <glm/glm.hpp>

namespace SpaceRaster
{
    struct ProjectionConfig
    {
        float fov      = 45.0f; // Vertical, degrees
        float nearClip = 0.1f;
        float farClip  = 100.0f;
    };

    enum class CameraMovement
    {
        FORWARD,
        BACKWARD,
        LEFT,
        RIGHT,
        UP,
        DOWN
    };

    /**
     * @brief Free look camera (position + yaw/pitch in degrees).
     * Mutated between frames only; the renderer sees it through MakeSnapshot().
     * Yaw 0 looks down +x, yaw -90 down -z. Pitch is clamped to [-89, 89].
     */
    class Camera
    {
    public:
        static constexpr float kPitchLimit = 89.0f;

        Camera( const glm::vec3& position = glm::vec3( 0.0f ), float yaw = -90.0f, float pitch = 0.0f,
                const ProjectionConfig& projection = ProjectionConfig() );

        void ProcessKeyboard( CameraMovement direction, float dt );

        // Offsets in pixels, scaled by the sensitivity
        void ProcessMouse( float xOffset, float yOffset );

        /**
         * @brief Places the camera on a sphere of the given radius around target, using the current
         * yaw/pitch, and looks at target.
         */
        void Orbit( const glm::vec3& target, float distance );

        void SetPosition( const glm::vec3& position ) { m_position = position; }
        void SetRotation( float yaw, float pitch );
        void SetSpeed( float speed ) { m_speed = speed; }
        void SetSensitivity( float sensitivity ) { m_sensitivity = sensitivity; }
        void SetProjection( const ProjectionConfig& projection ) { m_projection = projection; }

        const glm::vec3&        GetPosition() const { return m_position; }
        float                   GetYaw() const { return m_yaw; }
        float                   GetPitch() const { return m_pitch; }
        float                   GetSpeed() const { return m_speed; }
        float                   GetSensitivity() const { return m_sensitivity; }
        const ProjectionConfig& GetProjectionConfig() const { return m_projection; }

        glm::vec3 GetFront() const;
        glm::vec3 GetRight() const;
        glm::vec3 GetUp() const;

        glm::mat4 GetViewMatrix() const;
        glm::mat4 GetProjectionMatrix( float aspectRatio ) const;

        FrameSnapshot MakeSnapshot( const Viewport& viewport, float time ) const;

    private:
        glm::vec3        m_position;
        glm::vec3        m_target;
        bool             m_hasTarget = false;
        float            m_yaw;
        float            m_pitch;
        float            m_speed       = 2.5f;
        float            m_sensitivity = 0.1f;
        ProjectionConfig m_projection;
    };
} // namespace SpaceRaster
