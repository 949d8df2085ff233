#pragma once
#include <SpaceRaster.h>
#include <string>
#include <vector>

namespace Orrery
{
    /**
     * @brief Circular orbit in the xz plane plus a spin about the body's own y axis.
     * position(t) = ( sx * cos( w t + phase ) * R, height, sin( w t + phase ) * R ), sx = -1 when mirrored.
     */
    struct OrbitDescriptor
    {
        std::string             name;
        float                   orbitRadius  = 0.0f;
        float                   angularSpeed = 0.0f; // rad/s
        float                   phase        = 0.0f; // rad
        float                   height       = 0.0f;
        float                   spin         = 0.0f; // rad/s
        float                   scale        = 1.0f;
        SpaceRaster::ShaderType shader       = SpaceRaster::ShaderType::UNIFORM;
        bool                    mirrorX      = false; // Orbits clockwise seen from above
    };

    // T * Rz * Ry * Rx * S, rotation in radians
    glm::mat4 ComposeModelMatrix( const glm::vec3& translation, float scale, const glm::vec3& rotation );

    class SolarSystem
    {
    public:
        // The star and five planets
        SolarSystem();
        explicit SolarSystem( std::vector<OrbitDescriptor> bodies );

        static glm::vec3 GetPosition( const OrbitDescriptor& body, float time );
        static glm::mat4 GetModelMatrix( const OrbitDescriptor& body, float time );

        // One draw call per body, all sharing the same sphere mesh
        void Render( SpaceRaster::Renderer& renderer, float time ) const;

        const std::vector<OrbitDescriptor>& GetBodies() const { return m_bodies; }
        const SpaceRaster::Mesh&            GetMesh() const { return m_sphere; }

    private:
        std::vector<OrbitDescriptor> m_bodies;
        SpaceRaster::Mesh            m_sphere;
    };
} // namespace Orrery
