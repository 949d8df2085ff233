#pragma once
#include <SpaceRaster.h>

namespace Orrery
{
    /**
     * @brief Hashed background stars and slowly turning spiral galaxies.
     * Painted after the geometry, only into pixels no triangle covered.
     */
    class Starfield
    {
    public:
        static constexpr int kStarCount      = 800;
        static constexpr int kGalaxyCount    = 5;
        static constexpr int kGalaxyPoints   = 100;

        static void Paint( SpaceRaster::Framebuffer& framebuffer, float time );

        // Pixel position and grey level of star i for the given output size
        static glm::ivec2 GetStarPosition( int i, uint32_t width, uint32_t height );
        static uint8_t    GetStarBrightness( int i );
    };
} // namespace Orrery
