#pragma once
#include "core/Base.hpp"
#include <utility>

namespace SpaceRaster
{
    enum class Key : uint8_t
    {
        W = 0,
        A,
        S,
        D,
        ESCAPE,
        COUNT
    };

    /**
     * @brief Polled input state for the current frame.
     * There is no window; a driver (scripted playback, a test) writes the state between frames and
     * the scene reads it during its update.
     */
    class Input
    {
    public:
        static bool IsKeyPressed( Key key );
        static void SetKeyPressed( Key key, bool pressed );

        // Mouse movement since the previous frame, in pixels
        static std::pair<float, float> GetMouseDelta();
        static void                    AddMouseDelta( float dx, float dy );

        static float GetScrollY();
        static void  SetScrollY( float yOffset );

        static void RequestExit() { s_exitRequested = true; }
        static bool IsExitRequested() { return s_exitRequested; }

        // Clears per-frame accumulators (mouse delta, scroll). Held keys stay held.
        static void BeginFrame();

        // Releases everything, including the exit request
        static void Reset();

    private:
        static bool  s_keys[ static_cast<size_t>( Key::COUNT ) ];
        static float s_mouseDX;
        static float s_mouseDY;
        static float s_scrollY;
        static bool  s_exitRequested;
    };
} // namespace SpaceRaster
