#pragma once
#include "renderer/PipelineTypes.hpp"
#include <utility>

namespace SpaceRaster
{
    /**
     * @brief Barycentric triangle rasterizer.
     *
     * Vertex positions are snapped to a fixed-point grid of 1/256 pixel and the edge functions are
     * evaluated in 64 bit integers, so the coverage decision is exact. A pixel whose center lies on
     * an edge is owned only when that edge is a top or left edge; two triangles sharing an edge
     * with consistent winding therefore never both cover, and never both miss, a pixel on it.
     *
     * Depth is interpolated linearly in screen space. Positions, normal and color are interpolated
     * perspective-correct (weights scaled by 1/w and renormalized).
     */
    class Rasterizer
    {
    public:
        static constexpr int     kSubpixelBits = 8;
        static constexpr int64_t kSubpixelOne  = int64_t( 1 ) << kSubpixelBits;

        // Vertices further than this from the origin (in pixels) are refused so the fixed-point math cannot overflow
        static constexpr float kGuardBand = float( 1 << 20 );

        explicit Rasterizer( const Viewport& viewport )
            : m_viewport( viewport )
        {
        }

        /**
         * @brief Per-triangle values shared by every pixel of one Rasterize() call.
         */
        struct Setup
        {
            int64_t  fx[ 3 ], fy[ 3 ]; // Fixed-point vertex positions
            int64_t  area;             // Doubled signed area in fixed-point units, > 0
            bool     topLeft[ 3 ];     // Edge opposite vertex i is a top or left edge
            uint32_t minX, minY, maxX, maxY;
            float    invArea;
        };

        /**
         * @brief Validates the triangle and computes its setup.
         * @return false for degenerate, back-facing, out-of-guard-band or fully off-screen triangles.
         */
        bool ComputeSetup( const ScreenTriangle& tri, Setup& setup ) const;

        /**
         * @brief Builds the fragment for a covered pixel from its screen-space weights.
         */
        static Fragment Interpolate( const ScreenTriangle& tri, uint32_t x, uint32_t y, const glm::vec3& weights, float time );

        /**
         * @brief Emits one Fragment per covered pixel, in scanline order, each exactly once.
         * @param emit Called as emit( const Fragment& ).
         * @return Number of fragments emitted.
         */
        template<typename EmitFn>
        uint32_t Rasterize( const ScreenTriangle& tri, float time, EmitFn&& emit ) const
        {
            Setup setup;
            if( !ComputeSetup( tri, setup ) )
                return 0;
            return Rasterize( tri, setup, time, std::forward<EmitFn>( emit ) );
        }

        // Same as above for a setup already returned by ComputeSetup()
        template<typename EmitFn>
        uint32_t Rasterize( const ScreenTriangle& tri, const Setup& setup, float time, EmitFn&& emit ) const
        {
            uint32_t count = 0;
            for( uint32_t y = setup.minY; y <= setup.maxY; ++y )
            {
                const int64_t py = int64_t( y ) * kSubpixelOne + kSubpixelOne / 2;
                for( uint32_t x = setup.minX; x <= setup.maxX; ++x )
                {
                    const int64_t px = int64_t( x ) * kSubpixelOne + kSubpixelOne / 2;

                    int64_t e[ 3 ];
                    bool    covered = true;
                    for( int i = 0; i < 3 && covered; ++i )
                    {
                        int j  = ( i + 1 ) % 3;
                        int k  = ( i + 2 ) % 3;
                        e[ i ] = EdgeFunction( setup.fx[ j ], setup.fy[ j ], setup.fx[ k ], setup.fy[ k ], px, py );
                        covered = e[ i ] > 0 || ( e[ i ] == 0 && setup.topLeft[ i ] );
                    }
                    if( !covered )
                        continue;

                    glm::vec3 weights( float( e[ 0 ] ) * setup.invArea, float( e[ 1 ] ) * setup.invArea, float( e[ 2 ] ) * setup.invArea );
                    emit( Interpolate( tri, x, y, weights, time ) );
                    ++count;
                }
            }
            return count;
        }

        const Viewport& GetViewport() const { return m_viewport; }

        // E(a, b, p): positive when p is on the inner side of the edge a->b of a front-facing triangle
        static int64_t EdgeFunction( int64_t ax, int64_t ay, int64_t bx, int64_t by, int64_t px, int64_t py )
        {
            return ( px - ax ) * ( by - ay ) - ( py - ay ) * ( bx - ax );
        }

    private:
        Viewport m_viewport;
    };
} // namespace SpaceRaster
