#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace SpaceRaster
{
    // Error codes
    enum class Result : int32_t
    {
        SUCCESS      = 0,
        FAIL         = -1,
        INVALID_ARGS = -3,
        NOT_READY    = -5
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::NOT_READY:
                return "NOT_READY";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;
} // namespace SpaceRaster

#include "core/Log.hpp"

#if defined( _MSC_VER )
#    define SR_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define SR_DEBUGBREAK() raise( SIGTRAP )
#else
#    define SR_DEBUGBREAK()
#endif

#ifdef SR_DEBUG
#    define SR_ENABLE_ASSERTS
#endif

#ifdef SR_ENABLE_ASSERTS
#    define SR_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                SR_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                SR_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define SR_CORE_ASSERT( x, ... )
#endif
