#pragma once
#include <cstdint>
#include <glm/glm.hpp>

namespace SpaceRaster
{
    /**
     * @brief Closed set of procedural fragment shaders. The numeric values are stable selector codes.
     */
    enum class ShaderType : uint32_t
    {
        STAR      = 0,
        ROCKY     = 1,
        GAS_GIANT = 2,
        UNIFORM   = 3, // Spaceship: flat color
        ICE       = 4,
        DESERT    = 5,
        VOLCANIC  = 6,
    };

    constexpr uint32_t kShaderTypeCount = 7;

    inline const char* toString( ShaderType type )
    {
        switch( type )
        {
            case ShaderType::STAR:
                return "STAR";
            case ShaderType::ROCKY:
                return "ROCKY";
            case ShaderType::GAS_GIANT:
                return "GAS_GIANT";
            case ShaderType::UNIFORM:
                return "UNIFORM";
            case ShaderType::ICE:
                return "ICE";
            case ShaderType::DESERT:
                return "DESERT";
            case ShaderType::VOLCANIC:
                return "VOLCANIC";
            default:
                return "UNKNOWN";
        }
    }

    /**
     * @brief Output size in pixels. Raster coordinates: origin top-left, y down.
     */
    struct Viewport
    {
        uint32_t width  = 800;
        uint32_t height = 600;

        float GetAspectRatio() const { return height == 0 ? 1.0f : float( width ) / float( height ); }
    };

    /**
     * @brief Per draw call parameters, supplied fresh by the scene every frame.
     */
    struct DrawCall
    {
        glm::mat4  model  = glm::mat4( 1.0f );
        ShaderType shader = ShaderType::UNIFORM;
    };

    /**
     * @brief Immutable copy of everything a frame is rendered against.
     * Taken once at BeginFrame; camera or input changes made later only affect the next frame.
     */
    struct FrameSnapshot
    {
        glm::mat4 view       = glm::mat4( 1.0f );
        glm::mat4 projection = glm::mat4( 1.0f );
        glm::vec3 eye        = glm::vec3( 0.0f );
        float     time       = 0.0f;
    };

    /**
     * @brief Output of the vertex stage. Lives for one draw call.
     */
    struct TransformedVertex
    {
        glm::vec4  clipPosition  = glm::vec4( 0.0f ); // w kept for perspective correction
        glm::vec3  worldPosition = glm::vec3( 0.0f );
        glm::vec3  localPosition = glm::vec3( 0.0f ); // Object space, the shading coordinate
        glm::vec3  normal        = glm::vec3( 0.0f ); // World space, unit length or zero
        glm::vec3  color         = glm::vec3( 1.0f );
        ShaderType shader        = ShaderType::UNIFORM;
    };

    struct Triangle
    {
        TransformedVertex v[ 3 ];
    };

    /**
     * @brief A vertex after perspective divide and viewport mapping.
     */
    struct ScreenVertex
    {
        glm::vec2 position      = glm::vec2( 0.0f ); // Raster space pixels, y down
        float     depth         = 0.0f;              // NDC z, smaller is nearer
        float     invW          = 1.0f;              // 1 / clip w
        glm::vec3 worldPosition = glm::vec3( 0.0f );
        glm::vec3 localPosition = glm::vec3( 0.0f );
        glm::vec3 normal        = glm::vec3( 0.0f );
        glm::vec3 color         = glm::vec3( 1.0f );
    };

    struct ScreenTriangle
    {
        ScreenVertex v[ 3 ];
        ShaderType   shader = ShaderType::UNIFORM;
    };

    /**
     * @brief One covered pixel of one triangle. Produced by the rasterizer, shaded at most once.
     */
    struct Fragment
    {
        uint32_t   x = 0;
        uint32_t   y = 0;
        float      depth = 0.0f;
        glm::vec3  barycentric   = glm::vec3( 0.0f ); // Screen-space weights of v0, v1, v2
        glm::vec3  worldPosition = glm::vec3( 0.0f );
        glm::vec3  localPosition = glm::vec3( 0.0f );
        glm::vec3  normal        = glm::vec3( 0.0f );
        glm::vec3  color         = glm::vec3( 1.0f );
        ShaderType shader        = ShaderType::UNIFORM;
        float      time          = 0.0f;
    };
} // namespace SpaceRaster
