#include "math/Noise.hpp"

#include <array>
#include <cmath>
#include <cstdint>

namespace SpaceRaster
{
    namespace
    {
        // Ken Perlin's reference permutation, repeated once so lookups never need a wrap.
        constexpr std::array<uint8_t, 256> kPermutation = {
            151, 160, 137, 91,  90,  15,  131, 13,  201, 95,  96,  53,  194, 233, 7,   225, 140, 36,  103, 30,  69,  142, 8,   99,  37,  240,
            21,  10,  23,  190, 6,   148, 247, 120, 234, 75,  0,   26,  197, 62,  94,  252, 219, 203, 117, 35,  11,  32,  57,  177, 33,  88,
            237, 149, 56,  87,  174, 20,  125, 136, 171, 168, 68,  175, 74,  165, 71,  134, 139, 48,  27,  166, 77,  146, 158, 231, 83,  111,
            229, 122, 60,  211, 133, 230, 220, 105, 92,  41,  55,  46,  245, 40,  244, 102, 143, 54,  65,  25,  63,  161, 1,   216, 80,  73,
            209, 76,  132, 187, 208, 89,  18,  169, 200, 196, 135, 130, 116, 188, 159, 86,  164, 100, 109, 198, 173, 186, 3,   64,  52,  217,
            226, 250, 124, 123, 5,   202, 38,  147, 118, 126, 255, 82,  85,  212, 207, 206, 59,  227, 47,  16,  58,  17,  182, 189, 28,  42,
            223, 183, 170, 213, 119, 248, 152, 2,   44,  154, 163, 70,  221, 153, 101, 155, 167, 43,  172, 9,   129, 22,  39,  253, 19,  98,
            108, 110, 79,  113, 224, 232, 178, 185, 112, 104, 218, 246, 97,  228, 251, 34,  242, 193, 238, 210, 144, 12,  191, 179, 162, 241,
            81,  51,  145, 235, 249, 14,  239, 107, 49,  192, 214, 31,  181, 199, 106, 157, 184, 84,  204, 176, 115, 121, 50,  45,  127, 4,
            150, 254, 138, 236, 205, 93,  222, 114, 67,  29,  24,  72,  243, 141, 128, 195, 78,  66,  215, 61,  156, 180 };

        inline int Perm( int i )
        {
            return kPermutation[ static_cast<size_t>( i & 255 ) ];
        }

        // 6t^5 - 15t^4 + 10t^3: first and second derivatives vanish at 0 and 1
        inline float Fade( float t )
        {
            return t * t * t * ( t * ( t * 6.0f - 15.0f ) + 10.0f );
        }

        inline float Lerp( float a, float b, float t )
        {
            return a + t * ( b - a );
        }

        // Dot product with one of the 12 cube edge directions selected by the hash
        inline float Grad( int hash, float x, float y, float z )
        {
            int   h = hash & 15;
            float u = h < 8 ? x : y;
            float v = h < 4 ? y : ( h == 12 || h == 14 ? x : z );
            return ( ( h & 1 ) == 0 ? u : -u ) + ( ( h & 2 ) == 0 ? v : -v );
        }

        // Lattice cell modulo 256, reduced in float so huge coordinates never overflow the cast
        inline int WrapLattice( float cell )
        {
            float wrapped = cell - 256.0f * std::floor( cell / 256.0f );
            return static_cast<int>( wrapped ) & 255;
        }
    } // namespace

    float Noise::Perlin( const glm::vec3& p )
    {
        // Fbm can scale a finite point past float range
        if( !std::isfinite( p.x ) || !std::isfinite( p.y ) || !std::isfinite( p.z ) )
            return 0.0f;

        float fx = std::floor( p.x );
        float fy = std::floor( p.y );
        float fz = std::floor( p.z );

        int xi = WrapLattice( fx );
        int yi = WrapLattice( fy );
        int zi = WrapLattice( fz );

        float x = p.x - fx;
        float y = p.y - fy;
        float z = p.z - fz;

        float u = Fade( x );
        float v = Fade( y );
        float w = Fade( z );

        int a  = Perm( xi ) + yi;
        int aa = Perm( a ) + zi;
        int ab = Perm( a + 1 ) + zi;
        int b  = Perm( xi + 1 ) + yi;
        int ba = Perm( b ) + zi;
        int bb = Perm( b + 1 ) + zi;

        float result = Lerp( Lerp( Lerp( Grad( Perm( aa ), x, y, z ), Grad( Perm( ba ), x - 1.0f, y, z ), u ),
                                   Lerp( Grad( Perm( ab ), x, y - 1.0f, z ), Grad( Perm( bb ), x - 1.0f, y - 1.0f, z ), u ), v ),
                             Lerp( Lerp( Grad( Perm( aa + 1 ), x, y, z - 1.0f ), Grad( Perm( ba + 1 ), x - 1.0f, y, z - 1.0f ), u ),
                                   Lerp( Grad( Perm( ab + 1 ), x, y - 1.0f, z - 1.0f ), Grad( Perm( bb + 1 ), x - 1.0f, y - 1.0f, z - 1.0f ), u ), v ),
                             w );

        return glm::clamp( result, -1.0f, 1.0f );
    }

    float Noise::Fbm( const glm::vec3& p, int octaves, float persistence, float lacunarity )
    {
        if( octaves <= 0 )
            return 0.0f;

        float total     = 0.0f;
        float frequency = 1.0f;
        float amplitude = 1.0f;
        float maxValue  = 0.0f;

        for( int i = 0; i < octaves; ++i )
        {
            total += Perlin( p * frequency ) * amplitude;
            maxValue += amplitude;
            amplitude *= persistence;
            frequency *= lacunarity;
        }

        // persistence <= 0 leaves only the first octave with any weight
        if( maxValue <= 0.0f )
            return 0.0f;

        return glm::clamp( total / maxValue, -1.0f, 1.0f );
    }

    float Noise::Hash( const glm::vec3& p )
    {
        float s = std::sin( glm::dot( p, glm::vec3( 12.9898f, 78.233f, 45.5432f ) ) ) * 43758.5453f;
        float f = s - std::floor( s );
        return f < 1.0f ? f : 0.0f;
    }

    float Noise::Hash( float seed )
    {
        float s = std::sin( seed ) * 43758.5453f;
        float f = s - std::floor( s );
        return f < 1.0f ? f : 0.0f;
    }
} // namespace SpaceRaster
