#pragma once
#include "renderer/PipelineTypes.hpp"

namespace SpaceRaster
{
    enum class CullResult : uint8_t
    {
        ACCEPTED = 0,
        CLIPPED,     // Entirely outside the view volume, or a vertex at/behind the eye
        BACK_FACING, // Clockwise in NDC
        DEGENERATE   // Zero screen-space area
    };

    /**
     * @brief Triangle-granularity culling and clip-to-screen conversion.
     * Triangles are kept or dropped whole; nothing is ever split against the frustum.
     * Partially visible triangles rely on the rasterizer's bounding-box clamp.
     */
    class PrimitiveAssembly
    {
    public:
        // Overscan applied to the x/y planes so triangles do not pop at the screen border
        static constexpr float kClipMargin = 1.5f;

        // Smallest clip w that can still be divided by
        static constexpr float kMinW = 1e-6f;

        static constexpr float kAreaEpsilon = 1e-6f;

        /**
         * @brief True when all three vertices lie outside the same clip plane.
         */
        static bool IsOutsideClipVolume( const Triangle& tri );

        // Perspective divide + viewport mapping of one vertex. Expects w > kMinW.
        static ScreenVertex ToScreen( const TransformedVertex& v, const Viewport& viewport );

        /**
         * @brief Signed doubled area in raster space. Positive for front faces.
         */
        static float SignedArea( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c );

        /**
         * @brief Runs the clip-space test, then the back-face test (cheapest first).
         * @param out Filled only when the result is ACCEPTED.
         */
        static CullResult Assemble( const Triangle& tri, const Viewport& viewport, ScreenTriangle& out );
    };
} // namespace SpaceRaster
