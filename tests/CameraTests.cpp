#include "renderer/Camera.hpp"
#include <gtest/gtest.h>

using namespace SpaceRaster;

namespace
{
    void ExpectVecNear( const glm::vec3& a, const glm::vec3& b, float eps = 1e-5f )
    {
        EXPECT_NEAR( a.x, b.x, eps );
        EXPECT_NEAR( a.y, b.y, eps );
        EXPECT_NEAR( a.z, b.z, eps );
    }
} // namespace

TEST( CameraTests, DefaultLooksDownNegativeZ )
{
    Camera camera;
    ExpectVecNear( camera.GetFront(), glm::vec3( 0.0f, 0.0f, -1.0f ) );
    ExpectVecNear( camera.GetRight(), glm::vec3( 1.0f, 0.0f, 0.0f ) );
    ExpectVecNear( camera.GetUp(), glm::vec3( 0.0f, 1.0f, 0.0f ) );
}

TEST( CameraTests, PitchIsClamped )
{
    Camera camera( glm::vec3( 0.0f ), -90.0f, 120.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), 89.0f );

    camera.SetSensitivity( 1.0f );
    camera.ProcessMouse( 0.0f, -500.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), -89.0f );

    camera.ProcessMouse( 30.0f, 10.0f );
    EXPECT_FLOAT_EQ( camera.GetYaw(), -60.0f );
    EXPECT_FLOAT_EQ( camera.GetPitch(), -79.0f );
}

TEST( CameraTests, KeyboardMovesAlongBasis )
{
    Camera camera( glm::vec3( 0.0f ) );
    camera.SetSpeed( 2.0f );
    camera.ProcessKeyboard( CameraMovement::FORWARD, 0.5f );
    ExpectVecNear( camera.GetPosition(), glm::vec3( 0.0f, 0.0f, -1.0f ) );

    camera.ProcessKeyboard( CameraMovement::RIGHT, 1.0f );
    ExpectVecNear( camera.GetPosition(), glm::vec3( 2.0f, 0.0f, -1.0f ) );

    camera.ProcessKeyboard( CameraMovement::UP, 0.25f );
    ExpectVecNear( camera.GetPosition(), glm::vec3( 2.0f, 0.5f, -1.0f ) );
}

TEST( CameraTests, ViewMatrixMovesEyeToOrigin )
{
    Camera    camera( glm::vec3( 1.0f, 2.0f, 3.0f ), -90.0f, 0.0f );
    glm::vec4 eye = camera.GetViewMatrix() * glm::vec4( 1.0f, 2.0f, 3.0f, 1.0f );
    ExpectVecNear( glm::vec3( eye ), glm::vec3( 0.0f ) );

    // A point ahead of the camera lands on the negative z axis in view space
    glm::vec4 ahead = camera.GetViewMatrix() * glm::vec4( 1.0f, 2.0f, -2.0f, 1.0f );
    ExpectVecNear( glm::vec3( ahead ), glm::vec3( 0.0f, 0.0f, -5.0f ) );
}

TEST( CameraTests, OrbitKeepsDistanceAndLooksAtTarget )
{
    Camera    camera;
    glm::vec3 target( 4.0f, 1.0f, -2.0f );
    camera.SetRotation( 30.0f, -20.0f );
    camera.Orbit( target, 5.0f );

    EXPECT_NEAR( glm::distance( camera.GetPosition(), target ), 5.0f, 1e-4f );

    glm::vec4 t = camera.GetViewMatrix() * glm::vec4( target, 1.0f );
    EXPECT_NEAR( t.x, 0.0f, 1e-4f );
    EXPECT_NEAR( t.y, 0.0f, 1e-4f );
    EXPECT_NEAR( t.z, -5.0f, 1e-4f );
}

TEST( CameraTests, SnapshotCarriesProjectionAndTime )
{
    Camera        camera( glm::vec3( 0.0f, 0.0f, 3.0f ) );
    FrameSnapshot snapshot = camera.MakeSnapshot( Viewport{ 800, 600 }, 1.25f );

    EXPECT_FLOAT_EQ( snapshot.time, 1.25f );
    EXPECT_EQ( snapshot.eye, glm::vec3( 0.0f, 0.0f, 3.0f ) );
    EXPECT_EQ( snapshot.view, camera.GetViewMatrix() );

    // Points on the near and far planes map to NDC z = -1 and +1
    glm::vec4 nearPoint = snapshot.projection * glm::vec4( 0.0f, 0.0f, -0.1f, 1.0f );
    glm::vec4 farPoint  = snapshot.projection * glm::vec4( 0.0f, 0.0f, -100.0f, 1.0f );
    EXPECT_NEAR( nearPoint.z / nearPoint.w, -1.0f, 1e-4f );
    EXPECT_NEAR( farPoint.z / farPoint.w, 1.0f, 1e-3f );

    // Aspect ratio 4:3 widens x
    EXPECT_NEAR( snapshot.projection[ 1 ][ 1 ] / snapshot.projection[ 0 ][ 0 ], 800.0f / 600.0f, 1e-4f );
}
