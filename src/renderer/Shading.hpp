#pragma once
#include "renderer/Color.hpp"
#include "renderer/PipelineTypes.hpp"

namespace SpaceRaster
{
    /**
     * @brief Inputs every procedural shader sees for one fragment.
     */
    struct ShadingInput
    {
        glm::vec3 localPosition = glm::vec3( 0.0f ); // Object space; patterns are evaluated here
        glm::vec3 worldPosition = glm::vec3( 0.0f );
        glm::vec3 normal        = glm::vec3( 0.0f );
        float     time          = 0.0f; // Seconds of animation time
    };

    /**
     * @brief Procedural fragment shaders, one pure function per ShaderType.
     * Every function is defined for all finite inputs and its result is clamped by Color.
     */
    class Shading
    {
    public:
        /**
         * @brief Dispatches on the selector. Codes outside the known set fall back to the uniform shader.
         */
        static Color Shade( ShaderType type, const ShadingInput& input );
        static Color Shade( const Fragment& fragment );

        // Individual shaders, returned unclamped in linear [0, 1] terms
        static glm::vec3 Star( const ShadingInput& input );
        static glm::vec3 Rocky( const ShadingInput& input );
        static glm::vec3 GasGiant( const ShadingInput& input );
        static glm::vec3 Ice( const ShadingInput& input );
        static glm::vec3 Desert( const ShadingInput& input );
        static glm::vec3 Volcanic( const ShadingInput& input );
        static glm::vec3 Uniform( const ShadingInput& input );

        // Period of the star's brightness pulsation, in seconds
        static float GetStarPulsePeriod();
    };
} // namespace SpaceRaster
