#pragma once
#include "core/Log.hpp"
#include "runtime/Application.hpp"

int main( int argc, char** argv )
{
    SpaceRaster::Log::Init();

    SpaceRaster::AppConfig config;
    if( SpaceRaster::Application::ParseArgs( argc, argv, config ) != SpaceRaster::Result::SUCCESS )
    {
        SR_CORE_ERROR( "Usage: {0} [--frames N] [--dt SECONDS] [--out DIR] [--size WxH] [--no-write]", argv[ 0 ] );
        return 1;
    }

    // 1. Create the user's scene
    SpaceRaster::Scope<SpaceRaster::Scene> scene( SpaceRaster::CreateScene() );

    // 2. Wrap it in the Application host
    SpaceRaster::Application app( scene.get(), config );

    // 3. Run
    try
    {
        app.Run();
    }
    catch( const std::exception& e )
    {
        SR_CORE_CRITICAL( "Application crash: {}", e.what() );
        return -1;
    }

    return 0;
}
