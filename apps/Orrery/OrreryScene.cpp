#include "OrreryScene.hpp"

#include "Starfield.hpp"

namespace Orrery
{
    using namespace SpaceRaster;

    OrreryScene::OrreryScene( ScriptedInput input )
        : m_input( std::move( input ) )
    {
    }

    void OrreryScene::OnInit( const AppConfig& config )
    {
        // With no frame limit the tour itself decides when to stop
        m_input.SetExitWhenDone( config.frames == 0 );
        m_frame = 0;
        m_time  = 0.0f;
        m_camera.Follow( m_ship.GetPosition(), m_ship.GetCameraYaw() );

        SR_INFO( "Orrery: {0} bodies, ship mesh {1} triangles, tour of {2} frames", m_system.GetBodies().size(), m_ship.GetMesh().GetTriangleCount(),
                 m_input.GetTotalFrames() );
    }

    void OrreryScene::OnUpdate( float, float time )
    {
        m_time = time;
        m_input.Apply( m_frame++ );

        if( Input::IsKeyPressed( Key::ESCAPE ) )
            Input::RequestExit();

        if( Input::IsKeyPressed( Key::W ) )
            m_ship.MoveForward();
        if( Input::IsKeyPressed( Key::S ) )
            m_ship.MoveBackward();
        if( Input::IsKeyPressed( Key::A ) )
            m_ship.MoveLeft();
        if( Input::IsKeyPressed( Key::D ) )
            m_ship.MoveRight();
        m_ship.UpdateAnimation();

        auto [ dx, dy ] = Input::GetMouseDelta();
        if( dx != 0.0f || dy != 0.0f )
            m_camera.Rotate( dx, dy );

        float scroll = Input::GetScrollY();
        if( scroll != 0.0f )
            m_camera.Zoom( scroll );

        m_camera.Follow( m_ship.GetPosition(), m_ship.GetCameraYaw() );
    }

    FrameSnapshot OrreryScene::GetSnapshot( const Viewport& viewport, float time ) const
    {
        return m_camera.GetCamera().MakeSnapshot( viewport, time );
    }

    void OrreryScene::OnRender( Renderer& renderer )
    {
        m_system.Render( renderer, m_time );

        DrawCall ship;
        ship.model  = m_ship.GetModelMatrix();
        ship.shader = ShaderType::UNIFORM;
        if( renderer.Submit( m_ship.GetMesh(), ship ) != Result::SUCCESS )
            SR_WARN( "Spaceship was not drawn" );

        Starfield::Paint( renderer.GetFramebuffer(), m_time );
    }
} // namespace Orrery
