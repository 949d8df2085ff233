#include "renderer/Color.hpp"

#include <cmath>

namespace SpaceRaster
{
    namespace
    {
        uint8_t ClampChannel( float value )
        {
            // NaN fails both comparisons and lands on zero
            if( !( value > 0.0f ) )
                return 0;
            if( value >= 255.0f )
                return 255;
            return static_cast<uint8_t>( value + 0.5f );
        }
    } // namespace

    Color Color::FromFloat( const glm::vec3& rgb )
    {
        return Color( ClampChannel( rgb.r * 255.0f ), ClampChannel( rgb.g * 255.0f ), ClampChannel( rgb.b * 255.0f ) );
    }

    Color Color::FromHex( uint32_t hex )
    {
        return Color( static_cast<uint8_t>( ( hex >> 16 ) & 0xff ), static_cast<uint8_t>( ( hex >> 8 ) & 0xff ), static_cast<uint8_t>( hex & 0xff ) );
    }

    glm::vec3 Color::ToFloat() const
    {
        return glm::vec3( r, g, b ) * ( 1.0f / 255.0f );
    }

    Color Color::Scale( float factor ) const
    {
        return Color( ClampChannel( r * factor ), ClampChannel( g * factor ), ClampChannel( b * factor ) );
    }

    Color Color::Lerp( const Color& other, float t ) const
    {
        t = glm::clamp( t, 0.0f, 1.0f );
        return Color( ClampChannel( r + ( float( other.r ) - float( r ) ) * t ),
                      ClampChannel( g + ( float( other.g ) - float( g ) ) * t ),
                      ClampChannel( b + ( float( other.b ) - float( b ) ) * t ) );
    }

    Color Color::operator+( const Color& other ) const
    {
        return Color( ClampChannel( float( r ) + float( other.r ) ), ClampChannel( float( g ) + float( other.g ) ), ClampChannel( float( b ) + float( other.b ) ) );
    }
} // namespace SpaceRaster
