#pragma once
#include "core/Base.hpp"
#include "renderer/Color.hpp"
#include <limits>
#include <vector>

namespace SpaceRaster
{
    /**
     * @brief Color + depth grids of the same size, raster order (y = 0 is the top row).
     *
     * Depth[x,y] always holds the nearest depth accepted since the last Clear() and Color[x,y] the
     * color accepted with it. Nearer means numerically smaller. Callers must pass in-range
     * coordinates; the rasterizer's clamp guarantees it for pipeline writes.
     */
    class Framebuffer
    {
    public:
        static constexpr float kFarDepth = std::numeric_limits<float>::infinity();

        Framebuffer( uint32_t width, uint32_t height, Color background = Color::Black() );

        /**
         * @brief Resets depth to kFarDepth and color to the background color.
         */
        void Clear();
        void Clear( Color background );

        /**
         * @brief True if a fragment at this depth would be accepted. Does not modify anything.
         */
        bool DepthTest( uint32_t x, uint32_t y, float depth ) const
        {
            SR_CORE_ASSERT( IsInside( x, y ), "Framebuffer::DepthTest out of bounds" );
            return depth < m_depth[ Index( x, y ) ];
        }

        /**
         * @brief Writes color and depth only when depth is strictly nearer than the stored one.
         * Equal depth is rejected, so submitting the same fragment twice is a no-op the second time.
         * @return true if the fragment was accepted.
         */
        bool TestAndWrite( uint32_t x, uint32_t y, float depth, Color color );

        /**
         * @brief Paints behind all geometry: only pixels still at kFarDepth change, and depth is left untouched.
         */
        void PaintBackground( uint32_t x, uint32_t y, Color color );

        Color GetColor( uint32_t x, uint32_t y ) const { return m_color[ Index( x, y ) ]; }
        float GetDepth( uint32_t x, uint32_t y ) const { return m_depth[ Index( x, y ) ]; }

        bool IsInside( uint32_t x, uint32_t y ) const { return x < m_width && y < m_height; }
        bool IsInside( int x, int y ) const { return x >= 0 && y >= 0 && IsInside( uint32_t( x ), uint32_t( y ) ); }

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }
        Color    GetBackground() const { return m_background; }

        const std::vector<Color>& GetColorBuffer() const { return m_color; }
        const std::vector<float>& GetDepthBuffer() const { return m_depth; }

        /**
         * @brief Packs the color grid as tightly packed 8 bit RGB triples, row by row.
         */
        std::vector<uint8_t> ToRGB24() const;

    private:
        size_t Index( uint32_t x, uint32_t y ) const { return size_t( y ) * m_width + x; }

    private:
        uint32_t           m_width;
        uint32_t           m_height;
        Color              m_background;
        std::vector<Color> m_color;
        std::vector<float> m_depth;
    };
} // namespace SpaceRaster
