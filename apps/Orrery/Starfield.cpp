#include "Starfield.hpp"

#include <cmath>

namespace Orrery
{
    using namespace SpaceRaster;

    namespace
    {
        // Sine hash: fract( v * 43758.5453 ) in [0, 1)
        float Scatter( float v )
        {
            float s = v * 43758.5453f;
            float f = s - std::floor( s );
            return f < 1.0f ? f : 0.0f;
        }
    } // namespace

    glm::ivec2 Starfield::GetStarPosition( int i, uint32_t width, uint32_t height )
    {
        float seed = float( i ) * 12.9898f;
        int   x    = int( Noise::Hash( seed ) * float( width ) );
        int   y    = int( Scatter( std::cos( seed * 1.234f ) ) * float( height ) );
        return glm::ivec2( x, y );
    }

    uint8_t Starfield::GetStarBrightness( int i )
    {
        float seed = float( i ) * 12.9898f;
        float b    = ( std::sin( seed * 2.345f ) * 0.5f + 0.5f ) * 255.0f;
        return uint8_t( glm::clamp( b, 0.0f, 255.0f ) );
    }

    void Starfield::Paint( Framebuffer& framebuffer, float time )
    {
        const uint32_t width  = framebuffer.GetWidth();
        const uint32_t height = framebuffer.GetHeight();

        for( int i = 0; i < kStarCount; ++i )
        {
            glm::ivec2 p = GetStarPosition( i, width, height );
            if( !framebuffer.IsInside( p.x, p.y ) )
                continue;
            uint8_t b = GetStarBrightness( i );
            framebuffer.PaintBackground( uint32_t( p.x ), uint32_t( p.y ), Color( b, b, b ) );
        }

        for( int i = 0; i < kGalaxyCount; ++i )
        {
            float seed     = float( i ) * 7.321f;
            int   cx       = int( Noise::Hash( seed ) * float( width ) );
            int   cy       = int( Scatter( std::cos( seed * 3.456f ) ) * float( height ) );
            float rotation = time * 0.1f + seed;

            for( int j = 0; j < kGalaxyPoints; ++j )
            {
                float angle  = float( j ) * 0.3f + rotation;
                float radius = std::sqrt( float( j ) * 0.5f ) * 3.0f;
                int   x      = cx + int( std::cos( angle ) * radius );
                int   y      = cy + int( std::sin( angle ) * radius );
                if( !framebuffer.IsInside( x, y ) )
                    continue;

                float intensity = ( 1.0f - float( j ) / float( kGalaxyPoints ) ) * 150.0f;
                framebuffer.PaintBackground( uint32_t( x ), uint32_t( y ), Color( uint8_t( intensity * 0.8f ), uint8_t( intensity * 0.6f ), uint8_t( intensity ) ) );
            }
        }
    }
} // namespace Orrery
