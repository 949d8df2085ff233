#include "renderer/Renderer.hpp"

#include "renderer/PrimitiveAssembly.hpp"
#include "renderer/Shading.hpp"
#include "renderer/VertexStage.hpp"

namespace SpaceRaster
{
    Renderer::Renderer( const RendererConfig& config )
        : m_config( config )
        , m_viewport{ config.width, config.height }
        , m_framebuffer( config.width, config.height, config.background )
        , m_rasterizer( m_viewport )
    {
        Log::Init();
        SR_CORE_INFO( "Renderer created ({0}x{1})", config.width, config.height );
    }

    void Renderer::BeginFrame( const FrameSnapshot& frame )
    {
        if( m_inFrame )
            SR_CORE_WARN( "BeginFrame called twice without EndFrame, the previous frame is discarded" );

        m_frame   = frame;
        m_inFrame = true;
        m_stats   = RenderStats();
        m_framebuffer.Clear();
    }

    Result Renderer::ValidateMesh( const Mesh& mesh )
    {
        if( mesh.indices.size() % 3 != 0 )
        {
            SR_CORE_ERROR( "Mesh '{0}': index count {1} is not a multiple of 3", mesh.name, mesh.indices.size() );
            return Result::INVALID_ARGS;
        }

        const size_t vertexCount = mesh.vertices.size();
        for( uint32_t index: mesh.indices )
        {
            if( index >= vertexCount )
            {
                SR_CORE_ERROR( "Mesh '{0}': index {1} out of range ({2} vertices)", mesh.name, index, vertexCount );
                return Result::INVALID_ARGS;
            }
        }
        return Result::SUCCESS;
    }

    Result Renderer::Submit( const Mesh& mesh, const DrawCall& draw )
    {
        if( !m_inFrame )
        {
            SR_CORE_ERROR( "Submit called outside of a frame" );
            return Result::FAIL;
        }

        Result result = ValidateMesh( mesh );
        if( result != Result::SUCCESS )
            return result;

        m_stats.drawCalls++;
        VertexStage::TransformMesh( mesh.vertices, draw, m_frame, m_transformed );

        Triangle       tri;
        ScreenTriangle screen;
        for( size_t i = 0; i + 2 < mesh.indices.size(); i += 3 )
        {
            for( int k = 0; k < 3; ++k )
            {
                tri.v[ k ]        = m_transformed[ mesh.indices[ i + k ] ];
                tri.v[ k ].shader = draw.shader;
            }
            m_stats.submitted++;

            switch( PrimitiveAssembly::Assemble( tri, m_viewport, screen ) )
            {
                case CullResult::CLIPPED:
                    m_stats.clipped++;
                    break;
                case CullResult::BACK_FACING:
                    m_stats.backFacing++;
                    break;
                case CullResult::DEGENERATE:
                    m_stats.degenerate++;
                    break;
                case CullResult::ACCEPTED:
                    DrawScreenTriangle( screen );
                    break;
            }
        }
        return Result::SUCCESS;
    }

    void Renderer::DrawScreenTriangle( const ScreenTriangle& tri )
    {
        Rasterizer::Setup setup;
        if( !m_rasterizer.ComputeSetup( tri, setup ) )
            return;

        m_stats.rasterized++;
        m_stats.fragments += m_rasterizer.Rasterize( tri, setup, m_frame.time, [ this ]( const Fragment& fragment ) {
            // Shade only what survives the depth test
            if( !m_framebuffer.DepthTest( fragment.x, fragment.y, fragment.depth ) )
            {
                m_stats.depthRejected++;
                return;
            }

            Color color = Shading::Shade( fragment );
            m_stats.shaded++;
            m_framebuffer.TestAndWrite( fragment.x, fragment.y, fragment.depth, color );
        } );
    }

    const Framebuffer& Renderer::EndFrame()
    {
        if( !m_inFrame )
            SR_CORE_WARN( "EndFrame called without BeginFrame" );

        m_inFrame = false;
        SR_CORE_TRACE( "Frame: {0} draws, {1} tris, {2} clipped, {3} back, {4} degenerate, {5} rasterized, {6} fragments, {7} depth rejected, "
                       "{8} shaded",
                       m_stats.drawCalls, m_stats.submitted, m_stats.clipped, m_stats.backFacing, m_stats.degenerate, m_stats.rasterized,
                       m_stats.fragments, m_stats.depthRejected, m_stats.shaded );
        return m_framebuffer;
    }
} // namespace SpaceRaster
