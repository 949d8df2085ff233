#pragma once
#include "renderer/PipelineTypes.hpp"
#include "resources/Mesh.hpp"
#include <vector>

namespace SpaceRaster
{
    /**
     * @brief Model -> view -> projection transform of mesh vertices.
     * Never clips or discards; that is left to PrimitiveAssembly.
     */
    class VertexStage
    {
    public:
        /**
         * @brief Normal matrix of a model matrix: inverse-transpose of its upper 3x3.
         * Falls back to identity when the model matrix is singular.
         */
        static glm::mat3 ComputeNormalMatrix( const glm::mat4& model );

        static TransformedVertex Transform( const Vertex& vertex, const DrawCall& draw, const glm::mat4& viewProjection, const glm::mat3& normalMatrix );

        // Convenience overload that derives the combined matrices itself
        static TransformedVertex Transform( const Vertex& vertex, const DrawCall& draw, const glm::mat4& view, const glm::mat4& projection );

        /**
         * @brief Transforms a whole vertex array.
         * @param out Resized to vertices.size(). Reusing the same vector across draws avoids reallocations.
         */
        static void TransformMesh( const std::vector<Vertex>& vertices, const DrawCall& draw, const FrameSnapshot& frame, std::vector<TransformedVertex>& out );
    };
} // namespace SpaceRaster
