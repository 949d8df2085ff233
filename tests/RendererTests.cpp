#include "renderer/Camera.hpp"
#include "renderer/Renderer.hpp"
#include "renderer/Shading.hpp"
#include "resources/ShapeGenerator.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>

using namespace SpaceRaster;

namespace
{
    ScreenTriangle MakeScreenTriangle( glm::vec2 a, glm::vec2 b, glm::vec2 c, float depth, ShaderType shader )
    {
        ScreenTriangle tri;
        tri.v[ 0 ].position = a;
        tri.v[ 1 ].position = b;
        tri.v[ 2 ].position = c;
        for( auto& v: tri.v )
            v.depth = depth;
        tri.shader = shader;
        return tri;
    }

    // Unit quad in the z = 0 plane facing +z
    Mesh MakeQuad()
    {
        Mesh mesh;
        mesh.name     = "Quad";
        mesh.vertices = {
            { glm::vec3( -1, -1, 0 ), glm::vec3( 0, 0, 1 ), glm::vec3( 1 ) },
            { glm::vec3( 1, -1, 0 ), glm::vec3( 0, 0, 1 ), glm::vec3( 1 ) },
            { glm::vec3( 1, 1, 0 ), glm::vec3( 0, 0, 1 ), glm::vec3( 1 ) },
            { glm::vec3( -1, 1, 0 ), glm::vec3( 0, 0, 1 ), glm::vec3( 1 ) },
        };
        mesh.indices = { 0, 1, 2, 2, 3, 0 };
        return mesh;
    }

    class RendererTests : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            RendererConfig config;
            config.width      = 160;
            config.height     = 120;
            config.background = Color( 5, 5, 5 );
            renderer          = CreateScope<Renderer>( config );
            camera            = Camera( glm::vec3( 0.0f, 0.0f, 3.0f ), -90.0f, 0.0f );
        }

        FrameSnapshot Snapshot( float time = 0.0f ) const { return camera.MakeSnapshot( renderer->GetViewport(), time ); }

        Scope<Renderer> renderer;
        Camera          camera;
    };
} // namespace

TEST_F( RendererTests, SubmitOutsideFrameFails )
{
    EXPECT_EQ( renderer->Submit( MakeQuad(), DrawCall() ), Result::FAIL );

    renderer->BeginFrame( Snapshot() );
    renderer->EndFrame();
    EXPECT_EQ( renderer->Submit( MakeQuad(), DrawCall() ), Result::FAIL );
}

TEST_F( RendererTests, MalformedMeshesAreRejected )
{
    renderer->BeginFrame( Snapshot() );

    Mesh partial = MakeQuad();
    partial.indices.pop_back();
    EXPECT_EQ( renderer->Submit( partial, DrawCall() ), Result::INVALID_ARGS );

    Mesh outOfRange = MakeQuad();
    outOfRange.indices[ 4 ] = 17;
    EXPECT_EQ( renderer->Submit( outOfRange, DrawCall() ), Result::INVALID_ARGS );

    const Framebuffer& image = renderer->EndFrame();
    EXPECT_EQ( renderer->GetStats().submitted, 0u );
    EXPECT_EQ( image.GetColor( 80, 60 ), Color( 5, 5, 5 ) );
}

TEST_F( RendererTests, FrontFacingQuadIsShadedAndCentered )
{
    renderer->BeginFrame( Snapshot() );
    DrawCall draw;
    draw.shader = ShaderType::UNIFORM;
    ASSERT_EQ( renderer->Submit( MakeQuad(), draw ), Result::SUCCESS );
    const Framebuffer& image = renderer->EndFrame();

    EXPECT_EQ( image.GetColor( 80, 60 ), Color( 128, 128, 128 ) );
    EXPECT_LT( image.GetDepth( 80, 60 ), 1.0f );
    EXPECT_EQ( image.GetColor( 0, 0 ), Color( 5, 5, 5 ) );
    EXPECT_EQ( image.GetDepth( 0, 0 ), Framebuffer::kFarDepth );

    const RenderStats& stats = renderer->GetStats();
    EXPECT_EQ( stats.submitted, 2u );
    EXPECT_EQ( stats.rasterized, 2u );
    EXPECT_GT( stats.fragments, 0u );
    EXPECT_EQ( stats.shaded, stats.fragments );
}

TEST_F( RendererTests, BackFacingQuadProducesNoFragments )
{
    Mesh quad = MakeQuad();
    quad.indices = { 0, 2, 1, 2, 0, 3 };

    renderer->BeginFrame( Snapshot() );
    ASSERT_EQ( renderer->Submit( quad, DrawCall() ), Result::SUCCESS );
    renderer->EndFrame();

    EXPECT_EQ( renderer->GetStats().backFacing, 2u );
    EXPECT_EQ( renderer->GetStats().fragments, 0u );
}

TEST_F( RendererTests, GeometryBehindCameraIsClipped )
{
    DrawCall draw;
    draw.model = glm::translate( glm::mat4( 1.0f ), glm::vec3( 0.0f, 0.0f, 10.0f ) );

    renderer->BeginFrame( Snapshot() );
    ASSERT_EQ( renderer->Submit( MakeQuad(), draw ), Result::SUCCESS );
    renderer->EndFrame();

    EXPECT_EQ( renderer->GetStats().clipped, 2u );
    EXPECT_EQ( renderer->GetStats().fragments, 0u );
}

TEST_F( RendererTests, ResubmissionIsIdempotent )
{
    Mesh sphere = ShapeGenerator::CreateSphere( 1.0f, 12, 16 );
    DrawCall draw;
    draw.shader = ShaderType::ROCKY;

    renderer->BeginFrame( Snapshot() );
    renderer->Submit( sphere, draw );
    std::vector<Color> once  = renderer->GetFramebuffer().GetColorBuffer();
    std::vector<float> depth = renderer->GetFramebuffer().GetDepthBuffer();

    renderer->Submit( sphere, draw );
    renderer->EndFrame();

    EXPECT_EQ( renderer->GetFramebuffer().GetColorBuffer(), once );
    EXPECT_EQ( renderer->GetFramebuffer().GetDepthBuffer(), depth );
}

TEST_F( RendererTests, BeginFrameClearsPreviousImage )
{
    renderer->BeginFrame( Snapshot() );
    renderer->Submit( MakeQuad(), DrawCall() );
    renderer->EndFrame();
    ASSERT_NE( renderer->GetFramebuffer().GetColor( 80, 60 ), Color( 5, 5, 5 ) );

    renderer->BeginFrame( Snapshot() );
    const Framebuffer& image = renderer->EndFrame();
    EXPECT_EQ( image.GetColor( 80, 60 ), Color( 5, 5, 5 ) );
    EXPECT_EQ( renderer->GetStats().fragments, 0u );
}

TEST_F( RendererTests, ScreenTriangleWritesOnlyCoveredPixels )
{
    RendererConfig config;
    Renderer       full( config );
    full.BeginFrame( FrameSnapshot() );
    full.DrawScreenTriangle( MakeScreenTriangle( { 10, 10 }, { 10, 50 }, { 50, 10 }, 0.5f, ShaderType::UNIFORM ) );
    const Framebuffer& image = full.EndFrame();

    EXPECT_FLOAT_EQ( image.GetDepth( 11, 11 ), 0.5f );
    EXPECT_EQ( image.GetColor( 11, 11 ), Color( 128, 128, 128 ) );
    EXPECT_EQ( image.GetDepth( 60, 60 ), Framebuffer::kFarDepth );
    EXPECT_EQ( image.GetColor( 60, 60 ), config.background );
}

TEST_F( RendererTests, NearerTriangleWinsRegardlessOfOrder )
{
    ScreenTriangle nearTri = MakeScreenTriangle( { 10, 10 }, { 10, 60 }, { 60, 10 }, 0.2f, ShaderType::UNIFORM );
    ScreenTriangle farTri  = MakeScreenTriangle( { 0, 0 }, { 0, 80 }, { 80, 0 }, 0.8f, ShaderType::STAR );

    renderer->BeginFrame( FrameSnapshot() );
    renderer->DrawScreenTriangle( nearTri );
    renderer->DrawScreenTriangle( farTri );
    Color first = renderer->EndFrame().GetColor( 30, 30 );
    EXPECT_GT( renderer->GetStats().depthRejected, 0u );

    renderer->BeginFrame( FrameSnapshot() );
    renderer->DrawScreenTriangle( farTri );
    renderer->DrawScreenTriangle( nearTri );
    Color second = renderer->EndFrame().GetColor( 30, 30 );

    EXPECT_EQ( first, Color( 128, 128, 128 ) );
    EXPECT_EQ( second, Color( 128, 128, 128 ) );
    EXPECT_FLOAT_EQ( renderer->GetFramebuffer().GetDepth( 30, 30 ), 0.2f );
}

TEST_F( RendererTests, RefusedScreenTrianglesAreNotCountedAsRasterized )
{
    renderer->BeginFrame( FrameSnapshot() );

    // Entirely right of the 160 pixel wide viewport
    renderer->DrawScreenTriangle( MakeScreenTriangle( { 200, 10 }, { 200, 50 }, { 240, 10 }, 0.5f, ShaderType::UNIFORM ) );
    // Collapses to a point on the fixed-point grid
    renderer->DrawScreenTriangle( MakeScreenTriangle( { 20, 20 }, { 20, 20.0001f }, { 20.0001f, 20 }, 0.5f, ShaderType::UNIFORM ) );
    EXPECT_EQ( renderer->GetStats().rasterized, 0u );

    renderer->DrawScreenTriangle( MakeScreenTriangle( { 10, 10 }, { 10, 50 }, { 50, 10 }, 0.5f, ShaderType::UNIFORM ) );
    renderer->EndFrame();

    EXPECT_EQ( renderer->GetStats().rasterized, 1u );
    EXPECT_GT( renderer->GetStats().fragments, 0u );
}
