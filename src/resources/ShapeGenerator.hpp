#pragma once
#include "resources/Mesh.hpp"

namespace SpaceRaster
{
    /**
     * @brief Procedural meshes. All faces wind counter-clockwise seen from outside and carry unit normals.
     */
    class ShapeGenerator
    {
    public:
        static Mesh CreateBox( const glm::vec3& halfExtents = glm::vec3( 0.5f ) );
        static Mesh CreateSphere( float radius, int stacks, int slices );

        /**
         * @brief Flat regular hexagon in the y-z plane at the origin, one face towards +x and one towards -x.
         */
        static Mesh CreateHexagonPanel( float radius );

        /**
         * @brief Cockpit sphere with two struts and two hexagonal wing panels along the x axis. Unit-ish size.
         */
        static Mesh CreateSpaceship();

        /**
         * @brief Appends src to dst with its positions and normals transformed. Indices are rebased.
         */
        static void Append( Mesh& dst, const Mesh& src, const glm::mat4& transform = glm::mat4( 1.0f ) );
    };
} // namespace SpaceRaster
