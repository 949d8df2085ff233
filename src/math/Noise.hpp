#pragma once
#include <glm/glm.hpp>

namespace SpaceRaster
{
    /**
     * @brief Deterministic procedural noise used by the fragment shaders.
     * All functions are pure functions of their arguments and safe to call from any thread.
     */
    class Noise
    {
    public:
        /**
         * @brief Improved Perlin gradient noise.
         * Continuous with a continuous derivative across lattice cells, zero on every lattice point.
         * @return A value in [-1, 1].
         */
        static float Perlin( const glm::vec3& p );

        /**
         * @brief Fractal Brownian motion built on Perlin().
         * Octave k samples Perlin( p * lacunarity^k ) with weight persistence^k. The sum is divided
         * by the total weight, so the result stays in [-1, 1] for any octave count.
         * Two or three octaves is the cheap setting; each extra octave adds one full noise evaluation.
         * @return A value in [-1, 1], or 0 when octaves <= 0.
         */
        static float Fbm( const glm::vec3& p, int octaves, float persistence = 0.5f, float lacunarity = 2.0f );

        /**
         * @brief Cheap sine hash for sparse, uncorrelated features.
         * @return A value in [0, 1).
         */
        static float Hash( const glm::vec3& p );
        static float Hash( float seed );
    };
} // namespace SpaceRaster
