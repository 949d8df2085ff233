#include "platform/Input.hpp"

namespace SpaceRaster
{
    bool  Input::s_keys[ static_cast<size_t>( Key::COUNT ) ] = {};
    float Input::s_mouseDX                                   = 0.0f;
    float Input::s_mouseDY                                   = 0.0f;
    float Input::s_scrollY                                   = 0.0f;
    bool  Input::s_exitRequested                             = false;

    bool Input::IsKeyPressed( Key key )
    {
        if( key >= Key::COUNT )
            return false;
        return s_keys[ static_cast<size_t>( key ) ];
    }

    void Input::SetKeyPressed( Key key, bool pressed )
    {
        if( key >= Key::COUNT )
            return;
        s_keys[ static_cast<size_t>( key ) ] = pressed;
    }

    std::pair<float, float> Input::GetMouseDelta()
    {
        return { s_mouseDX, s_mouseDY };
    }

    void Input::AddMouseDelta( float dx, float dy )
    {
        s_mouseDX += dx;
        s_mouseDY += dy;
    }

    float Input::GetScrollY()
    {
        return s_scrollY;
    }

    void Input::SetScrollY( float yOffset )
    {
        s_scrollY = yOffset;
    }

    void Input::BeginFrame()
    {
        s_mouseDX = 0.0f;
        s_mouseDY = 0.0f;
        s_scrollY = 0.0f;
    }

    void Input::Reset()
    {
        for( bool& key: s_keys )
            key = false;
        BeginFrame();
        s_exitRequested = false;
    }
} // namespace SpaceRaster
