#pragma once
#include <SpaceRaster.h>
#include <vector>

namespace Orrery
{
    /**
     * @brief Deterministic stand-in for a keyboard and mouse.
     * Each step holds its keys and feeds its mouse/scroll deltas for a range of frames.
     */
    class ScriptedInput
    {
    public:
        struct Step
        {
            uint32_t                      frames = 1;
            std::vector<SpaceRaster::Key> keys;
            glm::vec2                     mouseDelta = glm::vec2( 0.0f ); // Per frame
            float                         scroll     = 0.0f;              // Per frame
        };

        ScriptedInput() = default;
        explicit ScriptedInput( std::vector<Step> steps );

        // A short tour: drift, strafe both ways, orbit the camera, zoom in and out
        static ScriptedInput CreateDefaultTour();

        /**
         * @brief Writes the state for this frame into SpaceRaster::Input.
         * After the last step all keys are released and, if requested, an exit is signalled.
         */
        void Apply( uint32_t frame ) const;

        uint32_t GetTotalFrames() const;
        void     SetExitWhenDone( bool exitWhenDone ) { m_exitWhenDone = exitWhenDone; }

    private:
        const Step* FindStep( uint32_t frame ) const;

    private:
        std::vector<Step> m_steps;
        bool              m_exitWhenDone = false;
    };
} // namespace Orrery
