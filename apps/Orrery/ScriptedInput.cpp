#include "ScriptedInput.hpp"

namespace Orrery
{
    using namespace SpaceRaster;

    ScriptedInput::ScriptedInput( std::vector<Step> steps )
        : m_steps( std::move( steps ) )
    {
    }

    ScriptedInput ScriptedInput::CreateDefaultTour()
    {
        std::vector<Step> steps;
        steps.push_back( { 60, {}, glm::vec2( 0.0f ), 0.0f } );
        steps.push_back( { 80, { Key::W }, glm::vec2( 0.0f ), 0.0f } );
        steps.push_back( { 40, { Key::A }, glm::vec2( 0.0f ), 0.0f } );
        steps.push_back( { 40, { Key::D }, glm::vec2( 0.0f ), 0.0f } );
        steps.push_back( { 90, {}, glm::vec2( 4.0f, 0.0f ), 0.0f } );
        steps.push_back( { 30, {}, glm::vec2( 0.0f, -3.0f ), 0.0f } );
        steps.push_back( { 20, {}, glm::vec2( 0.0f ), 0.2f } );
        steps.push_back( { 60, { Key::S, Key::D }, glm::vec2( 0.0f ), 0.0f } );
        steps.push_back( { 40, {}, glm::vec2( 0.0f ), -0.3f } );
        steps.push_back( { 140, { Key::W }, glm::vec2( -1.0f, 0.0f ), 0.0f } );
        return ScriptedInput( std::move( steps ) );
    }

    uint32_t ScriptedInput::GetTotalFrames() const
    {
        uint32_t total = 0;
        for( const Step& step: m_steps )
            total += step.frames;
        return total;
    }

    const ScriptedInput::Step* ScriptedInput::FindStep( uint32_t frame ) const
    {
        uint32_t start = 0;
        for( const Step& step: m_steps )
        {
            if( frame < start + step.frames )
                return &step;
            start += step.frames;
        }
        return nullptr;
    }

    void ScriptedInput::Apply( uint32_t frame ) const
    {
        for( size_t k = 0; k < static_cast<size_t>( Key::COUNT ); ++k )
            Input::SetKeyPressed( static_cast<Key>( k ), false );

        const Step* step = FindStep( frame );
        if( !step )
        {
            if( m_exitWhenDone )
                Input::RequestExit();
            return;
        }

        for( Key key: step->keys )
            Input::SetKeyPressed( key, true );
        Input::AddMouseDelta( step->mouseDelta.x, step->mouseDelta.y );
        Input::SetScrollY( step->scroll );
    }
} // namespace Orrery
