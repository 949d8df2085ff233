#include "renderer/PrimitiveAssembly.hpp"

#include <cmath>

namespace SpaceRaster
{
    bool PrimitiveAssembly::IsOutsideClipVolume( const Triangle& tri )
    {
        // One bit per clip plane; a plane rejects the triangle when every vertex sets its bit
        uint32_t outsideAll = 0x3f;
        for( const TransformedVertex& v : tri.v )
        {
            const glm::vec4& p      = v.clipPosition;
            float            limit  = std::abs( p.w ) * kClipMargin;
            uint32_t         planes = 0;

            if( p.x > limit )
                planes |= 1u << 0;
            if( p.x < -limit )
                planes |= 1u << 1;
            if( p.y > limit )
                planes |= 1u << 2;
            if( p.y < -limit )
                planes |= 1u << 3;
            if( p.z < -p.w )
                planes |= 1u << 4;
            if( p.z > p.w )
                planes |= 1u << 5;

            outsideAll &= planes;
        }
        return outsideAll != 0;
    }

    ScreenVertex PrimitiveAssembly::ToScreen( const TransformedVertex& v, const Viewport& viewport )
    {
        float     invW = 1.0f / v.clipPosition.w;
        glm::vec3 ndc  = glm::vec3( v.clipPosition ) * invW;

        ScreenVertex out;
        out.position.x    = ( ndc.x * 0.5f + 0.5f ) * float( viewport.width );
        out.position.y    = ( 1.0f - ( ndc.y * 0.5f + 0.5f ) ) * float( viewport.height );
        out.depth         = ndc.z;
        out.invW          = invW;
        out.worldPosition = v.worldPosition;
        out.localPosition = v.localPosition;
        out.normal        = v.normal;
        out.color         = v.color;
        return out;
    }

    float PrimitiveAssembly::SignedArea( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c )
    {
        return ( c.x - a.x ) * ( b.y - a.y ) - ( c.y - a.y ) * ( b.x - a.x );
    }

    CullResult PrimitiveAssembly::Assemble( const Triangle& tri, const Viewport& viewport, ScreenTriangle& out )
    {
        if( IsOutsideClipVolume( tri ) )
            return CullResult::CLIPPED;

        for( const TransformedVertex& v : tri.v )
        {
            if( !( v.clipPosition.w > kMinW ) )
                return CullResult::CLIPPED;
        }

        ScreenTriangle screen;
        for( int i = 0; i < 3; ++i )
            screen.v[ i ] = ToScreen( tri.v[ i ], viewport );
        screen.shader = tri.v[ 0 ].shader;

        float area = SignedArea( screen.v[ 0 ].position, screen.v[ 1 ].position, screen.v[ 2 ].position );
        if( !( std::abs( area ) >= kAreaEpsilon ) )
            return CullResult::DEGENERATE;
        if( area < 0.0f )
            return CullResult::BACK_FACING;

        out = screen;
        return CullResult::ACCEPTED;
    }
} // namespace SpaceRaster
