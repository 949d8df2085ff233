#pragma once
#include <cstdint>

namespace SpaceRaster
{
    /**
     * @brief Converts application (real) time into the animation time fed to the shaders.
     * Handles time scaling, pausing and frame counting.
     */
    class TimeController
    {
    public:
        static constexpr float kMaxDeltaTime = 0.1f;

        /**
         * @brief Sets the speed multiplier for the animation.
         * 1.0 = Real-time, 2.0 = 2x speed, 0.0 = Paused.
         */
        void  SetTimeScale( float scale ) { m_timeScale = scale < 0.0f ? 0.0f : scale; }
        float GetTimeScale() const { return m_timeScale; }

        /**
         * @brief Returns the total accumulated animation time (in seconds).
         */
        float GetTime() const { return m_time; }

        uint32_t GetFrameIndex() const { return m_frameIndex; }

        float GetDeltaTime() const { return m_deltaTime; }

        /**
         * @brief Advances the clocks by the real time elapsed since the previous frame.
         * Steps longer than kMaxDeltaTime are capped so a stall does not make bodies jump.
         */
        void Update( float realDt )
        {
            if( realDt > kMaxDeltaTime )
                realDt = kMaxDeltaTime;
            if( realDt < 0.0f )
                realDt = 0.0f;

            m_deltaTime = realDt * m_timeScale;
            m_time += m_deltaTime;
            m_frameIndex++;
        }

        void Reset()
        {
            m_time       = 0.0f;
            m_deltaTime  = 0.0f;
            m_frameIndex = 0;
        }

        bool IsPaused() const { return m_timeScale == 0.0f; }

    private:
        float    m_timeScale  = 1.0f;
        float    m_time       = 0.0f;
        float    m_deltaTime  = 0.0f;
        uint32_t m_frameIndex = 0;
    };
} // namespace SpaceRaster
