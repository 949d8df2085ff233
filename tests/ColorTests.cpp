#include "renderer/Color.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace SpaceRaster;

TEST( ColorTests, FromFloatClampsAndRounds )
{
    EXPECT_EQ( Color::FromFloat( glm::vec3( 0.0f, 0.5f, 1.0f ) ), Color( 0, 128, 255 ) );
    EXPECT_EQ( Color::FromFloat( glm::vec3( -3.0f, 2.0f, 1.5f ) ), Color( 0, 255, 255 ) );
}

TEST( ColorTests, FromFloatMapsNaNToZero )
{
    float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ( Color::FromFloat( glm::vec3( nan, 1.0f, nan ) ), Color( 0, 255, 0 ) );
}

TEST( ColorTests, AdditionSaturates )
{
    Color a( 200, 10, 255 );
    Color b( 100, 20, 1 );
    EXPECT_EQ( a + b, Color( 255, 30, 255 ) );
}

TEST( ColorTests, ScaleSaturatesAndClampsNegative )
{
    Color c( 100, 200, 50 );
    EXPECT_EQ( c * 2.0f, Color( 200, 255, 100 ) );
    EXPECT_EQ( c * -1.0f, Color::Black() );
    EXPECT_EQ( c * 0.5f, Color( 50, 100, 25 ) );
}

TEST( ColorTests, LerpClampsParameter )
{
    Color a( 0, 0, 0 );
    Color b( 200, 100, 50 );
    EXPECT_EQ( a.Lerp( b, 0.5f ), Color( 100, 50, 25 ) );
    EXPECT_EQ( a.Lerp( b, -1.0f ), a );
    EXPECT_EQ( a.Lerp( b, 4.0f ), b );
}

TEST( ColorTests, HexRoundTrip )
{
    Color c = Color::FromHex( 0x3366cc );
    EXPECT_EQ( c, Color( 0x33, 0x66, 0xcc ) );
    EXPECT_EQ( c.ToHex(), 0x3366ccu );
}

TEST( ColorTests, LuminanceOrdersBrightness )
{
    EXPECT_GT( Color::White().Luminance(), Color( 128, 128, 128 ).Luminance() );
    EXPECT_EQ( Color::Black().Luminance(), 0u );
}
