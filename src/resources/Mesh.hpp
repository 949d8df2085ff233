#pragma once
#include <cstdint>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace SpaceRaster
{
    /**
     * @brief Object-space vertex as produced by a mesh source.
     * The pipeline only reads it; transformed copies are written to per-draw scratch buffers.
     */
    struct Vertex
    {
        glm::vec3 position = glm::vec3( 0.0f );
        glm::vec3 normal   = glm::vec3( 0.0f, 1.0f, 0.0f );
        glm::vec3 color    = glm::vec3( 1.0f ); // Optional base color, white when unused
    };

    /**
     * @brief CPU-side triangle mesh. Every 3 indices form one triangle, counter-clockwise seen from the front.
     */
    struct Mesh
    {
        std::vector<Vertex>   vertices;
        std::vector<uint32_t> indices;
        std::string           name;

        size_t GetTriangleCount() const { return indices.size() / 3; }
    };
} // namespace SpaceRaster
