#pragma once

#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace SpaceRaster
{
    class Log
    {
    public:
        static void Init();

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_coreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_clientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };
} // namespace SpaceRaster

#define SR_CORE_TRACE( ... )    ::SpaceRaster::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define SR_CORE_INFO( ... )     ::SpaceRaster::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define SR_CORE_WARN( ... )     ::SpaceRaster::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define SR_CORE_ERROR( ... )    ::SpaceRaster::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define SR_CORE_CRITICAL( ... ) ::SpaceRaster::Log::GetCoreLogger()->critical( __VA_ARGS__ )

#define SR_TRACE( ... )    ::SpaceRaster::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define SR_INFO( ... )     ::SpaceRaster::Log::GetClientLogger()->info( __VA_ARGS__ )
#define SR_WARN( ... )     ::SpaceRaster::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define SR_ERROR( ... )    ::SpaceRaster::Log::GetClientLogger()->error( __VA_ARGS__ )
#define SR_CRITICAL( ... ) ::SpaceRaster::Log::GetClientLogger()->critical( __VA_ARGS__ )
