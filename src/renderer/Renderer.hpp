#pragma once
#include "core/Base.hpp"
#include "renderer/Framebuffer.hpp"
#include "renderer/PipelineTypes.hpp"
#include "renderer/Rasterizer.hpp"
#include "resources/Mesh.hpp"
#include <vector>

namespace SpaceRaster
{
    struct RendererConfig
    {
        uint32_t width      = 800;
        uint32_t height     = 600;
        Color    background = Color::Black();
    };

    /**
     * @brief Per-frame pipeline counters. Reset by BeginFrame().
     */
    struct RenderStats
    {
        uint32_t drawCalls     = 0;
        uint32_t submitted     = 0; // Triangles handed to primitive assembly
        uint32_t clipped       = 0;
        uint32_t backFacing    = 0;
        uint32_t degenerate    = 0;
        uint32_t rasterized    = 0; // Triangles accepted by the rasterizer setup
        uint32_t fragments     = 0;
        uint32_t depthRejected = 0;
        uint32_t shaded        = 0;
    };

    /**
     * @brief Software pipeline facade.
     * Vertex stage -> primitive assembly -> rasterizer -> depth test -> shading -> framebuffer.
     *
     * Usage per frame:
     *   renderer.BeginFrame( camera.MakeSnapshot( viewport, time ) );
     *   renderer.Submit( mesh, { model, ShaderType::ROCKY } );
     *   const Framebuffer& image = renderer.EndFrame();
     */
    class Renderer
    {
    public:
        explicit Renderer( const RendererConfig& config = RendererConfig() );
        ~Renderer() = default;

        // Copies the snapshot, clears color/depth and resets the statistics
        void BeginFrame( const FrameSnapshot& frame );

        /**
         * @brief Draws one mesh with the given transform and shader.
         * @return INVALID_ARGS for malformed index data (nothing is drawn), FAIL outside BeginFrame/EndFrame.
         */
        Result Submit( const Mesh& mesh, const DrawCall& draw );

        const Framebuffer& EndFrame();

        // Draws one already assembled screen triangle. Used by Submit() and by tests that work in raster space.
        void DrawScreenTriangle( const ScreenTriangle& tri );

        Framebuffer&         GetFramebuffer() { return m_framebuffer; }
        const Framebuffer&   GetFramebuffer() const { return m_framebuffer; }
        const RenderStats&   GetStats() const { return m_stats; }
        const Viewport&      GetViewport() const { return m_viewport; }
        const FrameSnapshot& GetFrame() const { return m_frame; }
        bool                 IsInFrame() const { return m_inFrame; }

    private:
        static Result ValidateMesh( const Mesh& mesh );

    private:
        RendererConfig m_config;
        Viewport       m_viewport;
        Framebuffer    m_framebuffer;
        Rasterizer     m_rasterizer;

        FrameSnapshot m_frame;
        bool          m_inFrame = false;
        RenderStats   m_stats;

        // Scratch, reused across draws
        std::vector<TransformedVertex> m_transformed;
    };
} // namespace SpaceRaster
