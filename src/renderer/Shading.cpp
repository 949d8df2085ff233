#include "renderer/Shading.hpp"

#include "math/Noise.hpp"
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace SpaceRaster
{
    namespace
    {
        constexpr float kStarPulseSpeed = 1.5f;

        glm::vec3 Direction( const glm::vec3& p )
        {
            float len2 = glm::dot( p, p );
            if( !( len2 > 1e-12f ) )
                return glm::vec3( 0.0f, 0.0f, 1.0f );
            return p / std::sqrt( len2 );
        }

        float Saturate( float v )
        {
            return glm::clamp( v, 0.0f, 1.0f );
        }

        // Maps [-1, 1] noise to [0, 1]
        float Unit( float n )
        {
            return Saturate( n * 0.5f + 0.5f );
        }
    } // namespace

    float Shading::GetStarPulsePeriod()
    {
        return glm::two_pi<float>() / kStarPulseSpeed;
    }

    glm::vec3 Shading::Star( const ShadingInput& input )
    {
        const glm::vec3& p = input.localPosition;
        float            r = Saturate( glm::length( p ) );

        const glm::vec3 core( 1.0f, 0.9f, 0.35f );
        const glm::vec3 rim( 1.0f, 0.55f, 0.1f );

        glm::vec3 color   = glm::mix( core, rim, 0.6f * r * r );
        float     falloff = 1.0f - 0.55f * r * r;

        float turbulence = Noise::Fbm( p * 3.0f + glm::vec3( 0.0f, 0.0f, input.time * 0.5f ), 2, 0.5f, 2.0f );
        float pulse      = 0.95f + 0.05f * std::sin( input.time * kStarPulseSpeed );

        color *= falloff * ( 1.0f + 0.08f * turbulence ) * pulse;
        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::Rocky( const ShadingInput& input )
    {
        glm::vec3 dir = Direction( input.localPosition );
        float     n   = Noise::Fbm( dir * 2.0f, 3, 0.5f, 2.0f );

        const float     threshold = 0.0f;
        const glm::vec3 oceanDeep( 0.0f, 0.1f, 0.3f );
        const glm::vec3 oceanShallow( 0.1f, 0.3f, 0.7f );
        const glm::vec3 landLow( 0.1f, 0.4f, 0.1f );
        const glm::vec3 landHigh( 0.6f, 0.5f, 0.3f );

        glm::vec3 color;
        if( n > threshold )
        {
            float land = Saturate( ( n - threshold ) / 0.5f );
            color      = glm::mix( landLow, landHigh, std::pow( land, 0.7f ) );

            float detail = Unit( Noise::Perlin( dir * 5.0f + glm::vec3( 0.0f, 0.0f, input.time * 0.1f ) ) );
            color        = glm::mix( color, glm::vec3( 0.9f ), detail * 0.15f );
        }
        else
        {
            float depth = Saturate( ( n + 0.5f ) / ( threshold + 0.5f ) );
            color       = glm::mix( oceanDeep, oceanShallow, depth );
        }

        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::GasGiant( const ShadingInput& input )
    {
        glm::vec3 dir = Direction( input.localPosition );

        float band = std::sin( ( dir.y + input.time * 0.02f ) * 8.0f + Noise::Perlin( dir * 15.0f + glm::vec3( input.time * 0.2f, 0.0f, 0.0f ) ) * 2.0f );

        const glm::vec3 light( 0.8f, 0.7f, 0.5f );
        const glm::vec3 dark( 0.6f, 0.4f, 0.2f );
        glm::vec3       color = glm::mix( light, dark, band * 0.5f + 0.5f );

        float clouds = Unit( Noise::Fbm( dir * 6.0f + glm::vec3( input.time * 0.3f, 0.0f, 0.0f ), 2, 0.5f, 2.0f ) );
        color        = glm::mix( color, glm::vec3( 1.0f ), clouds * 0.1f );

        // The storm: an ellipse on the +z hemisphere, twice as wide as it is tall
        if( dir.z > 0.0f )
        {
            float dx = ( dir.x - 0.3f ) / 0.3f;
            float dy = ( dir.y + 0.4f ) / 0.15f;
            float d  = dx * dx + dy * dy;
            if( d < 1.0f )
            {
                float storm = 1.0f - d;
                color       = glm::mix( color, glm::vec3( 0.95f, 0.3f, 0.15f ), storm * storm * 0.7f );
            }
        }

        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::Ice( const ShadingInput& input )
    {
        glm::vec3 dir = Direction( input.localPosition );

        const glm::vec3 ice( 0.8f, 0.9f, 1.0f );
        const glm::vec3 crackColor( 0.3f, 0.4f, 0.6f );

        float     drift = Unit( Noise::Fbm( dir * 3.0f + glm::vec3( 0.0f, input.time * 0.05f, 0.0f ), 3, 0.5f, 2.0f ) );
        glm::vec3 color = glm::mix( ice, crackColor, drift * 0.3f );

        // Cracks follow the zero set of a high-frequency fbm
        float crack = 1.0f - glm::smoothstep( 0.0f, 0.06f, std::abs( Noise::Fbm( dir * 8.0f, 3, 0.5f, 2.0f ) ) );
        color       = glm::mix( color, crackColor, crack * 0.7f );

        float glint = Unit( Noise::Perlin( dir * 40.0f ) );
        if( glint > 0.8f )
            color = glm::mix( color, glm::vec3( 1.0f ), ( glint - 0.8f ) / 0.2f );

        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::Desert( const ShadingInput& input )
    {
        glm::vec3 dir = Direction( input.localPosition );

        const glm::vec3 sandDark( 0.6f, 0.4f, 0.1f );
        const glm::vec3 sandLight( 0.9f, 0.7f, 0.3f );
        const glm::vec3 ridge( 0.95f, 0.8f, 0.4f );

        float     grain = Noise::Fbm( dir * 4.0f + glm::vec3( input.time * 0.02f, 0.0f, 0.0f ), 2, 0.6f, 2.0f );
        glm::vec3 color = glm::mix( sandDark, sandLight, Saturate( 0.5f + 0.25f * grain ) );

        float dunes = std::sin( dir.y * 10.0f + dir.x * 4.0f + Noise::Perlin( dir * 6.0f ) * 2.0f ) * 0.5f + 0.5f;
        color       = glm::mix( color, ridge, dunes * 0.3f );

        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::Volcanic( const ShadingInput& input )
    {
        glm::vec3 dir = Direction( input.localPosition );

        const glm::vec3 rock( 0.08f, 0.06f, 0.05f );
        const glm::vec3 lava( 1.0f, 0.3f, 0.0f );

        float     ridge = 1.0f - std::abs( Noise::Fbm( dir * 3.0f, 3, 0.5f, 2.0f ) );
        float     vein  = glm::smoothstep( 0.85f, 1.0f, ridge );
        glm::vec3 color = glm::mix( rock, glm::vec3( 0.2f, 0.15f, 0.1f ), Unit( Noise::Perlin( dir * 10.0f ) ) * 0.3f );

        if( vein > 0.0f )
        {
            color       = glm::mix( color, lava, vein * vein );
            float pulse = std::sin( input.time * 2.0f + dir.x * 5.0f ) * 0.5f + 0.5f;
            color       = glm::mix( color, glm::vec3( 1.0f, 0.5f, 0.0f ), pulse * vein * 0.4f );
        }

        return glm::clamp( color, 0.0f, 1.0f );
    }

    glm::vec3 Shading::Uniform( const ShadingInput& )
    {
        return glm::vec3( 0.5f, 0.5f, 0.5f );
    }

    Color Shading::Shade( ShaderType type, const ShadingInput& input )
    {
        glm::vec3 rgb;
        switch( type )
        {
            case ShaderType::STAR:
                rgb = Star( input );
                break;
            case ShaderType::ROCKY:
                rgb = Rocky( input );
                break;
            case ShaderType::GAS_GIANT:
                rgb = GasGiant( input );
                break;
            case ShaderType::ICE:
                rgb = Ice( input );
                break;
            case ShaderType::DESERT:
                rgb = Desert( input );
                break;
            case ShaderType::VOLCANIC:
                rgb = Volcanic( input );
                break;
            case ShaderType::UNIFORM:
            default:
                rgb = Uniform( input );
                break;
        }
        return Color::FromFloat( rgb );
    }

    Color Shading::Shade( const Fragment& fragment )
    {
        ShadingInput input;
        input.localPosition = fragment.localPosition;
        input.worldPosition = fragment.worldPosition;
        input.normal        = fragment.normal;
        input.time          = fragment.time;
        return Shade( fragment.shader, input );
    }
} // namespace SpaceRaster
