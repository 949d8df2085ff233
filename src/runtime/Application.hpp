#pragma once
#include "core/Base.hpp"
#include "core/TimeController.hpp"
#include "renderer/Renderer.hpp"
#include <string>

namespace SpaceRaster
{
    struct AppConfig
    {
        uint32_t    width       = 800;
        uint32_t    height      = 600;
        uint32_t    frames      = 600;   // 0 = run until the scene or the input asks to exit
        float       dt          = 0.01f; // Animation time step per frame, seconds
        std::string outputDir   = "frames";
        bool        writeFrames = true;
        Color       background  = Color::Black();
    };

    /**
     * @brief User content driven by the Application, one update and one render per frame.
     */
    class Scene
    {
    public:
        virtual ~Scene() = default;

        virtual void OnInit( const AppConfig& config ) = 0;

        // Reads input and advances the scene by dt seconds of animation time
        virtual void OnUpdate( float dt, float time ) = 0;

        // Camera state frozen for the coming frame
        virtual FrameSnapshot GetSnapshot( const Viewport& viewport, float time ) const = 0;

        // Called between Renderer::BeginFrame and Renderer::EndFrame
        virtual void OnRender( Renderer& renderer ) = 0;

        virtual bool IsFinished() const { return false; }
    };

    // Implemented by the client application, called once by the entry point.
    Scene* CreateScene();

    class Application
    {
    public:
        Application( Scene* scene, const AppConfig& config );
        ~Application();

        /**
         * @brief Applies "--frames N", "--out DIR", "--dt SECONDS", "--no-write" and "--size WxH" to config.
         * @return INVALID_ARGS on unknown flags or malformed values; config is left partially updated.
         */
        static Result ParseArgs( int argc, char** argv, AppConfig& config );

        // Throws std::runtime_error when the output directory cannot be prepared
        void InitCore();
        void Run();

        uint32_t              GetFrameCount() const { return m_frameCount; }
        const TimeController& GetTimeController() const { return m_time; }
        Renderer*             GetRenderer() const { return m_renderer.get(); }

    private:
        std::string FrameFileName( uint32_t frame ) const;

    private:
        AppConfig m_config;
        bool      m_running    = false;
        uint32_t  m_frameCount = 0;

        Scope<Renderer> m_renderer;
        TimeController  m_time;

        Scene* m_scene = nullptr;
    };
} // namespace SpaceRaster
