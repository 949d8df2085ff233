#include "renderer/VertexStage.hpp"

#include <cmath>
#include <glm/gtc/matrix_inverse.hpp>

namespace SpaceRaster
{
    namespace
    {
        constexpr float kSingularEpsilon = 1e-12f;
        constexpr float kNormalEpsilon   = 1e-12f;

        glm::vec3 SafeNormalize( const glm::vec3& v )
        {
            float len2 = glm::dot( v, v );
            if( !( len2 > kNormalEpsilon ) )
                return glm::vec3( 0.0f );
            return v / std::sqrt( len2 );
        }
    } // namespace

    glm::mat3 VertexStage::ComputeNormalMatrix( const glm::mat4& model )
    {
        glm::mat3 upper( model );
        float     det = glm::determinant( upper );
        if( !( std::abs( det ) > kSingularEpsilon ) )
            return glm::mat3( 1.0f );

        return glm::inverseTranspose( upper );
    }

    TransformedVertex VertexStage::Transform( const Vertex& vertex, const DrawCall& draw, const glm::mat4& viewProjection, const glm::mat3& normalMatrix )
    {
        glm::vec4 world = draw.model * glm::vec4( vertex.position, 1.0f );

        TransformedVertex out;
        out.clipPosition  = viewProjection * world;
        out.worldPosition = glm::vec3( world );
        out.localPosition = vertex.position;
        out.normal        = SafeNormalize( normalMatrix * vertex.normal );
        out.color         = vertex.color;
        out.shader        = draw.shader;
        return out;
    }

    TransformedVertex VertexStage::Transform( const Vertex& vertex, const DrawCall& draw, const glm::mat4& view, const glm::mat4& projection )
    {
        return Transform( vertex, draw, projection * view, ComputeNormalMatrix( draw.model ) );
    }

    void VertexStage::TransformMesh( const std::vector<Vertex>& vertices, const DrawCall& draw, const FrameSnapshot& frame, std::vector<TransformedVertex>& out )
    {
        const glm::mat4 viewProjection = frame.projection * frame.view;
        const glm::mat3 normalMatrix   = ComputeNormalMatrix( draw.model );

        out.resize( vertices.size() );
        for( size_t i = 0; i < vertices.size(); ++i )
            out[ i ] = Transform( vertices[ i ], draw, viewProjection, normalMatrix );
    }
} // namespace SpaceRaster
