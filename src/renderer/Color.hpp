#pragma once
#include <cstdint>
#include <glm/glm.hpp>

namespace SpaceRaster
{
    /**
     * @brief 8 bit per channel RGB color.
     * All arithmetic saturates to [0, 255], so a Color is always a displayable value.
     */
    struct Color
    {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;

        constexpr Color() = default;
        constexpr Color( uint8_t red, uint8_t green, uint8_t blue )
            : r( red )
            , g( green )
            , b( blue )
        {
        }

        /**
         * @brief Converts a linear [0, 1] color. Channels outside the range and NaN clamp to the nearest bound.
         */
        static Color FromFloat( const glm::vec3& rgb );
        static Color FromHex( uint32_t hex );

        glm::vec3 ToFloat() const;
        uint32_t  ToHex() const { return ( uint32_t( r ) << 16 ) | ( uint32_t( g ) << 8 ) | uint32_t( b ); }

        // Scales every channel; negative factors give black
        Color Scale( float factor ) const;
        Color Lerp( const Color& other, float t ) const;

        Color operator+( const Color& other ) const;
        Color operator*( float factor ) const { return Scale( factor ); }

        bool operator==( const Color& other ) const { return r == other.r && g == other.g && b == other.b; }
        bool operator!=( const Color& other ) const { return !( *this == other ); }

        // Sum of channels, used to compare brightness
        uint32_t Luminance() const { return uint32_t( r ) + uint32_t( g ) + uint32_t( b ); }

        static constexpr Color Black() { return Color( 0, 0, 0 ); }
        static constexpr Color White() { return Color( 255, 255, 255 ); }
    };
} // namespace SpaceRaster
