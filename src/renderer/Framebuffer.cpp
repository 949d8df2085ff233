#include "renderer/Framebuffer.hpp"

#include <algorithm>

namespace SpaceRaster
{
    Framebuffer::Framebuffer( uint32_t width, uint32_t height, Color background )
        : m_width( width )
        , m_height( height )
        , m_background( background )
        , m_color( size_t( width ) * height, background )
        , m_depth( size_t( width ) * height, kFarDepth )
    {
    }

    void Framebuffer::Clear()
    {
        std::fill( m_color.begin(), m_color.end(), m_background );
        std::fill( m_depth.begin(), m_depth.end(), kFarDepth );
    }

    void Framebuffer::Clear( Color background )
    {
        m_background = background;
        Clear();
    }

    bool Framebuffer::TestAndWrite( uint32_t x, uint32_t y, float depth, Color color )
    {
        SR_CORE_ASSERT( IsInside( x, y ), "Framebuffer::TestAndWrite out of bounds" );

        size_t index = Index( x, y );
        // NaN depth compares false and is rejected
        if( !( depth < m_depth[ index ] ) )
            return false;

        m_depth[ index ] = depth;
        m_color[ index ] = color;
        return true;
    }

    void Framebuffer::PaintBackground( uint32_t x, uint32_t y, Color color )
    {
        SR_CORE_ASSERT( IsInside( x, y ), "Framebuffer::PaintBackground out of bounds" );

        size_t index = Index( x, y );
        if( m_depth[ index ] == kFarDepth )
            m_color[ index ] = color;
    }

    std::vector<uint8_t> Framebuffer::ToRGB24() const
    {
        std::vector<uint8_t> out;
        out.reserve( m_color.size() * 3 );
        for( const Color& c : m_color )
        {
            out.push_back( c.r );
            out.push_back( c.g );
            out.push_back( c.b );
        }
        return out;
    }
} // namespace SpaceRaster
