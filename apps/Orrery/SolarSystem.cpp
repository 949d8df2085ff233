#include "SolarSystem.hpp"

#include <cmath>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace Orrery
{
    using namespace SpaceRaster;

    glm::mat4 ComposeModelMatrix( const glm::vec3& translation, float scale, const glm::vec3& rotation )
    {
        glm::mat4 model = glm::translate( glm::mat4( 1.0f ), translation );
        model           = glm::rotate( model, rotation.z, glm::vec3( 0.0f, 0.0f, 1.0f ) );
        model           = glm::rotate( model, rotation.y, glm::vec3( 0.0f, 1.0f, 0.0f ) );
        model           = glm::rotate( model, rotation.x, glm::vec3( 1.0f, 0.0f, 0.0f ) );
        return glm::scale( model, glm::vec3( scale ) );
    }

    SolarSystem::SolarSystem()
        : SolarSystem( std::vector<OrbitDescriptor>{
              { "Sun", 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 5.0f, ShaderType::STAR, false },
              { "Rocky", 8.0f, 0.3f, 0.0f, 0.0f, 0.5f, 0.8f, ShaderType::ROCKY, false },
              { "GasGiant", 12.0f, 0.15f, 0.0f, 0.5f, 0.3f, 1.2f, ShaderType::GAS_GIANT, true },
              { "Ice", 10.0f, 0.25f, glm::half_pi<float>(), -0.3f, 0.4f, 0.7f, ShaderType::ICE, false },
              { "Desert", 32.0f, 0.35f, glm::pi<float>(), 0.2f, 0.6f, 3.0f, ShaderType::DESERT, false },
              { "Volcanic", 70.0f, 0.4f, 1.5f * glm::pi<float>(), -0.5f, 0.7f, 4.5f, ShaderType::VOLCANIC, false },
          } )
    {
    }

    SolarSystem::SolarSystem( std::vector<OrbitDescriptor> bodies )
        : m_bodies( std::move( bodies ) )
        , m_sphere( ShapeGenerator::CreateSphere( 1.0f, 24, 32 ) )
    {
        m_sphere.name = "Planet";
    }

    glm::vec3 SolarSystem::GetPosition( const OrbitDescriptor& body, float time )
    {
        float angle = body.angularSpeed * time + body.phase;
        float x     = std::cos( angle ) * body.orbitRadius;
        return glm::vec3( body.mirrorX ? -x : x, body.height, std::sin( angle ) * body.orbitRadius );
    }

    glm::mat4 SolarSystem::GetModelMatrix( const OrbitDescriptor& body, float time )
    {
        return ComposeModelMatrix( GetPosition( body, time ), body.scale, glm::vec3( 0.0f, body.spin * time, 0.0f ) );
    }

    void SolarSystem::Render( Renderer& renderer, float time ) const
    {
        for( const OrbitDescriptor& body: m_bodies )
        {
            DrawCall draw;
            draw.model  = GetModelMatrix( body, time );
            draw.shader = body.shader;
            if( renderer.Submit( m_sphere, draw ) != Result::SUCCESS )
                SR_WARN( "Body '{0}' was not drawn", body.name );
        }
    }
} // namespace Orrery
