#pragma once
#include "ChaseCamera.hpp"
#include "ScriptedInput.hpp"
#include "SolarSystem.hpp"
#include "Spaceship.hpp"
#include <runtime/Application.hpp>

namespace Orrery
{
    /**
     * @brief Star, five planets, the player's ship and a chase camera over a starfield.
     */
    class OrreryScene : public SpaceRaster::Scene
    {
    public:
        explicit OrreryScene( ScriptedInput input = ScriptedInput::CreateDefaultTour() );

        void                       OnInit( const SpaceRaster::AppConfig& config ) override;
        void                       OnUpdate( float dt, float time ) override;
        SpaceRaster::FrameSnapshot GetSnapshot( const SpaceRaster::Viewport& viewport, float time ) const override;
        void                       OnRender( SpaceRaster::Renderer& renderer ) override;

        const Spaceship&   GetShip() const { return m_ship; }
        const ChaseCamera& GetCamera() const { return m_camera; }
        const SolarSystem& GetSolarSystem() const { return m_system; }

    private:
        SolarSystem   m_system;
        Spaceship     m_ship;
        ChaseCamera   m_camera;
        ScriptedInput m_input;

        uint32_t m_frame = 0;
        float    m_time  = 0.0f;
    };
} // namespace Orrery
