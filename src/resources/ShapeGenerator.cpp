#include "resources/ShapeGenerator.hpp"

#include <cmath>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace SpaceRaster
{
    Mesh ShapeGenerator::CreateBox( const glm::vec3& halfExtents )
    {
        Mesh mesh;
        mesh.name = "Box";

        // 6 faces, 4 vertices and 2 triangles each
        mesh.vertices.reserve( 24 );
        mesh.indices.reserve( 36 );

        auto addFace = [ & ]( glm::vec3 normal, glm::vec3 v0, glm::vec3 v1, glm::vec3 v2, glm::vec3 v3 ) {
            uint32_t baseIndex = ( uint32_t )mesh.vertices.size();

            mesh.vertices.push_back( { v0, normal, glm::vec3( 1.0f ) } );
            mesh.vertices.push_back( { v1, normal, glm::vec3( 1.0f ) } );
            mesh.vertices.push_back( { v2, normal, glm::vec3( 1.0f ) } );
            mesh.vertices.push_back( { v3, normal, glm::vec3( 1.0f ) } );

            // v0..v3 go counter-clockwise around the face normal
            mesh.indices.push_back( baseIndex + 0 );
            mesh.indices.push_back( baseIndex + 1 );
            mesh.indices.push_back( baseIndex + 2 );
            mesh.indices.push_back( baseIndex + 2 );
            mesh.indices.push_back( baseIndex + 3 );
            mesh.indices.push_back( baseIndex + 0 );
        };

        const glm::vec3& h = halfExtents;
        glm::vec3        p0( -h.x, -h.y, h.z );
        glm::vec3        p1( h.x, -h.y, h.z );
        glm::vec3        p2( h.x, h.y, h.z );
        glm::vec3        p3( -h.x, h.y, h.z );
        glm::vec3        p4( -h.x, -h.y, -h.z );
        glm::vec3        p5( h.x, -h.y, -h.z );
        glm::vec3        p6( h.x, h.y, -h.z );
        glm::vec3        p7( -h.x, h.y, -h.z );

        // Front, Back, Right, Left, Top, Bottom
        addFace( { 0, 0, 1 }, p0, p1, p2, p3 );
        addFace( { 0, 0, -1 }, p5, p4, p7, p6 );
        addFace( { 1, 0, 0 }, p1, p5, p6, p2 );
        addFace( { -1, 0, 0 }, p4, p0, p3, p7 );
        addFace( { 0, 1, 0 }, p3, p2, p6, p7 );
        addFace( { 0, -1, 0 }, p4, p5, p1, p0 );

        return mesh;
    }

    Mesh ShapeGenerator::CreateSphere( float radius, int stacks, int slices )
    {
        Mesh mesh;
        mesh.name = "Sphere";
        if( stacks < 2 || slices < 3 || !( radius > 0.0f ) )
            return mesh;

        size_t vertexCount = size_t( stacks + 1 ) * size_t( slices + 1 );
        size_t indexCount  = size_t( stacks ) * size_t( slices ) * 6;

        mesh.vertices.reserve( vertexCount );
        mesh.indices.reserve( indexCount );

        for( int i = 0; i <= stacks; ++i )
        {
            float phi = glm::pi<float>() * float( i ) / float( stacks ); // 0 (north pole) to PI
            float y   = cos( phi );
            float r   = sin( phi );

            for( int j = 0; j <= slices; ++j )
            {
                float theta = 2.0f * glm::pi<float>() * float( j ) / float( slices );
                float x     = r * cos( theta );
                float z     = r * sin( theta );

                glm::vec3 normal( x, y, z );
                mesh.vertices.push_back( { normal * radius, normal, glm::vec3( 1.0f ) } );
            }
        }

        // 'second' is the ring below 'first'; both triangles are counter-clockwise from outside
        for( int i = 0; i < stacks; ++i )
        {
            for( int j = 0; j < slices; ++j )
            {
                uint32_t first  = uint32_t( i * ( slices + 1 ) + j );
                uint32_t second = first + uint32_t( slices ) + 1;

                if( i != 0 )
                {
                    mesh.indices.push_back( first );
                    mesh.indices.push_back( first + 1 );
                    mesh.indices.push_back( second );
                }
                if( i != stacks - 1 )
                {
                    mesh.indices.push_back( second );
                    mesh.indices.push_back( first + 1 );
                    mesh.indices.push_back( second + 1 );
                }
            }
        }
        return mesh;
    }

    Mesh ShapeGenerator::CreateHexagonPanel( float radius )
    {
        Mesh mesh;
        mesh.name = "HexagonPanel";

        // Seen from +x the screen right axis is -z, so (sin a, -cos a) in (y, z) turns counter-clockwise
        auto ring = [ radius ]( int k ) {
            float a = glm::two_pi<float>() * float( k ) / 6.0f;
            return glm::vec3( 0.0f, radius * sin( a ), -radius * cos( a ) );
        };

        for( float side: { 1.0f, -1.0f } )
        {
            glm::vec3 normal( side, 0.0f, 0.0f );
            uint32_t  center = ( uint32_t )mesh.vertices.size();
            mesh.vertices.push_back( { glm::vec3( 0.0f ), normal, glm::vec3( 1.0f ) } );
            for( int k = 0; k < 6; ++k )
                mesh.vertices.push_back( { ring( k ), normal, glm::vec3( 1.0f ) } );

            for( uint32_t k = 0; k < 6; ++k )
            {
                uint32_t a = center + 1 + k;
                uint32_t b = center + 1 + ( k + 1 ) % 6;
                mesh.indices.push_back( center );
                mesh.indices.push_back( side > 0.0f ? a : b );
                mesh.indices.push_back( side > 0.0f ? b : a );
            }
        }
        return mesh;
    }

    Mesh ShapeGenerator::CreateSpaceship()
    {
        Mesh ship;
        ship.name = "Spaceship";

        Append( ship, CreateSphere( 0.5f, 12, 16 ) );

        Mesh strut = CreateBox( glm::vec3( 0.4f, 0.06f, 0.06f ) );
        Mesh wing  = CreateHexagonPanel( 1.0f );
        for( float side: { 1.0f, -1.0f } )
        {
            Append( ship, strut, glm::translate( glm::mat4( 1.0f ), glm::vec3( side * 0.8f, 0.0f, 0.0f ) ) );
            Append( ship, wing, glm::translate( glm::mat4( 1.0f ), glm::vec3( side * 1.2f, 0.0f, 0.0f ) ) );
        }
        return ship;
    }

    void ShapeGenerator::Append( Mesh& dst, const Mesh& src, const glm::mat4& transform )
    {
        glm::mat3 normalMatrix = glm::transpose( glm::inverse( glm::mat3( transform ) ) );
        uint32_t  base         = ( uint32_t )dst.vertices.size();

        dst.vertices.reserve( dst.vertices.size() + src.vertices.size() );
        for( const Vertex& v: src.vertices )
        {
            Vertex    out = v;
            glm::vec3 n   = normalMatrix * v.normal;
            float     len = glm::length( n );

            out.position = glm::vec3( transform * glm::vec4( v.position, 1.0f ) );
            out.normal   = len > 1e-6f ? n / len : v.normal;
            dst.vertices.push_back( out );
        }

        dst.indices.reserve( dst.indices.size() + src.indices.size() );
        for( uint32_t index: src.indices )
            dst.indices.push_back( base + index );
    }
} // namespace SpaceRaster
