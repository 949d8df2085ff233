#include "renderer/Rasterizer.hpp"

#include <algorithm>
#include <cmath>

namespace SpaceRaster
{
    namespace
    {
        int64_t ToFixed( float v )
        {
            return static_cast<int64_t>( std::llround( double( v ) * double( Rasterizer::kSubpixelOne ) ) );
        }

        // Raster space, y down, front faces wound so that the inside is on the positive side.
        // Left edges run downwards; top edges are horizontal and run leftwards.
        bool IsTopLeft( int64_t ax, int64_t ay, int64_t bx, int64_t by )
        {
            int64_t dx = bx - ax;
            int64_t dy = by - ay;
            return dy > 0 || ( dy == 0 && dx < 0 );
        }

        glm::vec3 SafeNormalize( const glm::vec3& v )
        {
            float len2 = glm::dot( v, v );
            if( !( len2 > 1e-12f ) )
                return glm::vec3( 0.0f );
            return v / std::sqrt( len2 );
        }
    } // namespace

    bool Rasterizer::ComputeSetup( const ScreenTriangle& tri, Setup& setup ) const
    {
        if( m_viewport.width == 0 || m_viewport.height == 0 )
            return false;

        for( int i = 0; i < 3; ++i )
        {
            const glm::vec2& p = tri.v[ i ].position;
            // Also rejects NaN
            if( !( std::abs( p.x ) < kGuardBand && std::abs( p.y ) < kGuardBand ) )
                return false;
            setup.fx[ i ] = ToFixed( p.x );
            setup.fy[ i ] = ToFixed( p.y );
        }

        setup.area = EdgeFunction( setup.fx[ 0 ], setup.fy[ 0 ], setup.fx[ 1 ], setup.fy[ 1 ], setup.fx[ 2 ], setup.fy[ 2 ] );
        if( setup.area <= 0 )
            return false;
        setup.invArea = float( 1.0 / double( setup.area ) );

        for( int i = 0; i < 3; ++i )
        {
            int j              = ( i + 1 ) % 3;
            int k              = ( i + 2 ) % 3;
            setup.topLeft[ i ] = IsTopLeft( setup.fx[ j ], setup.fy[ j ], setup.fx[ k ], setup.fy[ k ] );
        }

        float minX = std::min( { tri.v[ 0 ].position.x, tri.v[ 1 ].position.x, tri.v[ 2 ].position.x } );
        float maxX = std::max( { tri.v[ 0 ].position.x, tri.v[ 1 ].position.x, tri.v[ 2 ].position.x } );
        float minY = std::min( { tri.v[ 0 ].position.y, tri.v[ 1 ].position.y, tri.v[ 2 ].position.y } );
        float maxY = std::max( { tri.v[ 0 ].position.y, tri.v[ 1 ].position.y, tri.v[ 2 ].position.y } );

        const float lastX = float( m_viewport.width - 1 );
        const float lastY = float( m_viewport.height - 1 );

        float boxMinX = std::floor( minX );
        float boxMinY = std::floor( minY );
        float boxMaxX = std::ceil( maxX );
        float boxMaxY = std::ceil( maxY );

        if( boxMaxX < 0.0f || boxMaxY < 0.0f || boxMinX > lastX || boxMinY > lastY )
            return false;

        setup.minX = uint32_t( std::clamp( boxMinX, 0.0f, lastX ) );
        setup.minY = uint32_t( std::clamp( boxMinY, 0.0f, lastY ) );
        setup.maxX = uint32_t( std::clamp( boxMaxX, 0.0f, lastX ) );
        setup.maxY = uint32_t( std::clamp( boxMaxY, 0.0f, lastY ) );
        return true;
    }

    Fragment Rasterizer::Interpolate( const ScreenTriangle& tri, uint32_t x, uint32_t y, const glm::vec3& weights, float time )
    {
        const ScreenVertex& a = tri.v[ 0 ];
        const ScreenVertex& b = tri.v[ 1 ];
        const ScreenVertex& c = tri.v[ 2 ];

        Fragment frag;
        frag.x           = x;
        frag.y           = y;
        frag.barycentric = weights;
        frag.depth       = weights.x * a.depth + weights.y * b.depth + weights.z * c.depth;
        frag.shader      = tri.shader;
        frag.time        = time;

        glm::vec3 pw( weights.x * a.invW, weights.y * b.invW, weights.z * c.invW );
        float     sum = pw.x + pw.y + pw.z;
        if( sum > 0.0f )
            pw /= sum;
        else
            pw = weights;

        frag.worldPosition = a.worldPosition * pw.x + b.worldPosition * pw.y + c.worldPosition * pw.z;
        frag.localPosition = a.localPosition * pw.x + b.localPosition * pw.y + c.localPosition * pw.z;
        frag.normal        = SafeNormalize( a.normal * pw.x + b.normal * pw.y + c.normal * pw.z );
        frag.color         = a.color * pw.x + b.color * pw.y + c.color * pw.z;
        return frag;
    }
} // namespace SpaceRaster
