#include "runtime/Application.hpp"

#include "core/FileSystem.hpp"
#include "core/Timer.hpp"
#include "platform/ImageWriter.hpp"
#include "platform/Input.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace SpaceRaster
{
    namespace
    {
        // Decimal digits up to UINT32_MAX; end is left on the first character not consumed
        bool ParseUInt32( const char* text, const char*& end, uint32_t& out )
        {
            if( !std::isdigit( static_cast<unsigned char>( *text ) ) )
                return false;

            errno                    = 0;
            char*              stop  = nullptr;
            unsigned long long value = std::strtoull( text, &stop, 10 );
            end                      = stop;
            if( errno == ERANGE || value > std::numeric_limits<uint32_t>::max() )
                return false;

            out = static_cast<uint32_t>( value );
            return true;
        }
    } // namespace

    Application::Application( Scene* scene, const AppConfig& config )
        : m_config( config )
        , m_scene( scene )
    {
        SR_CORE_ASSERT( m_scene, "Scene cannot be null!" );
    }

    Application::~Application()
    {
        m_renderer.reset();
    }

    Result Application::ParseArgs( int argc, char** argv, AppConfig& config )
    {
        for( int i = 1; i < argc; ++i )
        {
            std::string_view arg = argv[ i ];
            bool             hasValue = i + 1 < argc;

            if( arg == "--no-write" )
            {
                config.writeFrames = false;
            }
            else if( arg == "--frames" && hasValue )
            {
                const char* end   = nullptr;
                uint32_t    value = 0;
                if( !ParseUInt32( argv[ ++i ], end, value ) || *end != '\0' )
                    return Result::INVALID_ARGS;
                config.frames = value;
            }
            else if( arg == "--dt" && hasValue )
            {
                char* end   = nullptr;
                float value = std::strtof( argv[ ++i ], &end );
                if( *end != '\0' || !( value > 0.0f ) )
                    return Result::INVALID_ARGS;
                config.dt = value;
            }
            else if( arg == "--out" && hasValue )
            {
                config.outputDir = argv[ ++i ];
                if( config.outputDir.empty() )
                    return Result::INVALID_ARGS;
            }
            else if( arg == "--size" && hasValue )
            {
                const char* end    = nullptr;
                uint32_t    width  = 0;
                uint32_t    height = 0;
                if( !ParseUInt32( argv[ ++i ], end, width ) || *end != 'x' )
                    return Result::INVALID_ARGS;
                if( !ParseUInt32( end + 1, end, height ) || *end != '\0' || width == 0 || height == 0 )
                    return Result::INVALID_ARGS;
                config.width  = width;
                config.height = height;
            }
            else
            {
                SR_CORE_ERROR( "Unknown or incomplete argument: {0}", arg );
                return Result::INVALID_ARGS;
            }
        }
        return Result::SUCCESS;
    }

    void Application::InitCore()
    {
        if( m_config.writeFrames && FileSystem::Init( m_config.outputDir ) != Result::SUCCESS )
            throw std::runtime_error( "Failed to prepare output directory: " + m_config.outputDir );

        RendererConfig rConfig;
        rConfig.width      = m_config.width;
        rConfig.height     = m_config.height;
        rConfig.background = m_config.background;
        m_renderer         = CreateScope<Renderer>( rConfig );

        m_time.Reset();
        m_frameCount = 0;
        m_scene->OnInit( m_config );
    }

    std::string Application::FrameFileName( uint32_t frame ) const
    {
        return fmt::format( "frame_{:05d}.ppm", frame );
    }

    void Application::Run()
    {
        InitCore();
        SR_CORE_INFO( "[Application] Main Loop Started ({0}x{1}, {2} frames).", m_config.width, m_config.height, m_config.frames );

        Timer    wall;
        Timer    frameTimer;
        float    slowestFrame = 0.0f;
        bool     writeFrames  = m_config.writeFrames;
        Viewport viewport     = m_renderer->GetViewport();

        m_running = true;
        while( m_running )
        {
            frameTimer.Reset();

            // 1. Advance time and let the scene read input
            m_time.Update( m_config.dt );
            m_scene->OnUpdate( m_time.GetDeltaTime(), m_time.GetTime() );

            // 2. Render against a frozen snapshot
            m_renderer->BeginFrame( m_scene->GetSnapshot( viewport, m_time.GetTime() ) );
            m_scene->OnRender( *m_renderer );
            const Framebuffer& image = m_renderer->EndFrame();

            // 3. Present
            if( writeFrames )
            {
                if( ImageWriter::WritePPM( image, FileSystem::GetPath( FrameFileName( m_frameCount ) ) ) != Result::SUCCESS )
                {
                    SR_CORE_ERROR( "[Application] Frame {0} could not be written, disabling output.", m_frameCount );
                    writeFrames = false;
                }
            }

            m_frameCount++;
            slowestFrame = std::max( slowestFrame, frameTimer.ElapsedMillis() );
            Input::BeginFrame();

            if( m_config.frames != 0 && m_frameCount >= m_config.frames )
                m_running = false;
            if( Input::IsExitRequested() || m_scene->IsFinished() )
                m_running = false;
        }

        float seconds = wall.Elapsed();
        SR_CORE_INFO( "[Application] {0} frames in {1:.2f} s ({2:.1f} FPS, slowest {3:.2f} ms).", m_frameCount, seconds,
                      seconds > 0.0f ? float( m_frameCount ) / seconds : 0.0f, slowestFrame );
    }
} // namespace SpaceRaster
