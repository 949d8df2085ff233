#include "core/Base.hpp"
#include "core/FileSystem.hpp"
#include "core/TimeController.hpp"
#include "core/Timer.hpp"
#include "platform/Input.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <gtest/gtest.h>

using namespace SpaceRaster;

// =================================================================================================
// 1. Time
// =================================================================================================

TEST( TimeControllerTests, AccumulatesScaledTime )
{
    TimeController time;
    time.Update( 0.01f );
    time.Update( 0.01f );
    EXPECT_NEAR( time.GetTime(), 0.02f, 1e-6f );
    EXPECT_EQ( time.GetFrameIndex(), 2u );

    time.SetTimeScale( 2.0f );
    time.Update( 0.01f );
    EXPECT_NEAR( time.GetDeltaTime(), 0.02f, 1e-6f );
    EXPECT_NEAR( time.GetTime(), 0.04f, 1e-6f );
}

TEST( TimeControllerTests, ClampsLongAndNegativeSteps )
{
    TimeController time;
    time.Update( 5.0f );
    EXPECT_FLOAT_EQ( time.GetDeltaTime(), TimeController::kMaxDeltaTime );

    time.Update( -1.0f );
    EXPECT_FLOAT_EQ( time.GetDeltaTime(), 0.0f );
    EXPECT_FLOAT_EQ( time.GetTime(), TimeController::kMaxDeltaTime );
}

TEST( TimeControllerTests, PauseFreezesTimeButCountsFrames )
{
    TimeController time;
    time.SetTimeScale( -3.0f );
    EXPECT_TRUE( time.IsPaused() );

    time.Update( 0.05f );
    EXPECT_FLOAT_EQ( time.GetTime(), 0.0f );
    EXPECT_EQ( time.GetFrameIndex(), 1u );

    time.Reset();
    EXPECT_EQ( time.GetFrameIndex(), 0u );
}

TEST( TimerTests, ElapsedIsMonotonic )
{
    Timer timer;
    float a = timer.Elapsed();
    float b = timer.Elapsed();
    EXPECT_GE( a, 0.0f );
    EXPECT_GE( b, a );
    EXPECT_GE( timer.ElapsedMillis(), b * 1000.0f );
}

// =================================================================================================
// 2. Errors
// =================================================================================================

TEST( ResultTests, ToStringNamesEveryCode )
{
    EXPECT_EQ( toString( Result::SUCCESS ), "SUCCESS" );
    EXPECT_EQ( toString( Result::FAIL ), "FAIL" );
    EXPECT_EQ( toString( Result::INVALID_ARGS ), "INVALID_ARGS" );
    EXPECT_EQ( toString( Result::NOT_READY ), "NOT_READY" );
}

TEST( OwnershipTests, CreateScopeForwardsArguments )
{
    Scope<std::string> text = CreateScope<std::string>( 3, 'x' );
    ASSERT_NE( text, nullptr );
    EXPECT_EQ( *text, "xxx" );
}

TEST( OwnershipTests, LoggersAreSharedAfterInit )
{
    Log::Init();
    Ref<spdlog::logger> core = Log::GetCoreLogger();
    ASSERT_NE( core, nullptr );
    EXPECT_EQ( core->name(), "CORE" );
    EXPECT_EQ( Log::GetClientLogger()->name(), "CLIENT" );

    // A second Init keeps the same loggers
    Log::Init();
    EXPECT_EQ( Log::GetCoreLogger(), core );
}

// =================================================================================================
// 3. FileSystem
// =================================================================================================

class FileSystemTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_tempBase = std::filesystem::current_path() / "temp_fs_test";
        if( std::filesystem::exists( m_tempBase ) )
            std::filesystem::remove_all( m_tempBase );
    }

    void TearDown() override
    {
        if( std::filesystem::exists( m_tempBase ) )
            std::filesystem::remove_all( m_tempBase );
    }

    std::filesystem::path m_tempBase;
};

TEST_F( FileSystemTest, InitCreatesMissingRoot )
{
    std::filesystem::path root = m_tempBase / "frames" / "run1";
    ASSERT_EQ( FileSystem::Init( root ), Result::SUCCESS );

    EXPECT_TRUE( std::filesystem::is_directory( root ) );
    EXPECT_TRUE( FileSystem::IsInitialized() );
    EXPECT_EQ( FileSystem::GetPath( "frame_00000.ppm" ), root / "frame_00000.ppm" );
}

TEST_F( FileSystemTest, RelativeRootResolvesAgainstWorkingDirectory )
{
    std::filesystem::path relative = std::filesystem::relative( m_tempBase / "rel", std::filesystem::current_path() );
    ASSERT_EQ( FileSystem::Init( relative ), Result::SUCCESS );
    EXPECT_TRUE( FileSystem::GetRoot().is_absolute() );
    EXPECT_TRUE( std::filesystem::is_directory( m_tempBase / "rel" ) );
}

TEST_F( FileSystemTest, InitRejectsEmptyPathAndFiles )
{
    EXPECT_EQ( FileSystem::Init( "" ), Result::INVALID_ARGS );

    std::filesystem::create_directories( m_tempBase );
    std::filesystem::path file = m_tempBase / "not_a_dir";
    std::ofstream( file ) << "x";
    EXPECT_EQ( FileSystem::Init( file ), Result::FAIL );
}

// =================================================================================================
// 4. Input
// =================================================================================================

class InputTest : public ::testing::Test
{
protected:
    void SetUp() override { Input::Reset(); }
    void TearDown() override { Input::Reset(); }
};

TEST_F( InputTest, KeysStayHeldAcrossFrames )
{
    Input::SetKeyPressed( Key::W, true );
    Input::BeginFrame();
    EXPECT_TRUE( Input::IsKeyPressed( Key::W ) );
    EXPECT_FALSE( Input::IsKeyPressed( Key::S ) );
    EXPECT_FALSE( Input::IsKeyPressed( Key::COUNT ) );
}

TEST_F( InputTest, EveryBoundKeyIsIndependent )
{
    const Key keys[] = { Key::W, Key::A, Key::S, Key::D, Key::ESCAPE };
    static_assert( std::size( keys ) == static_cast<size_t>( Key::COUNT ) );

    for( Key pressed: keys )
    {
        Input::Reset();
        Input::SetKeyPressed( pressed, true );
        for( Key key: keys )
            EXPECT_EQ( Input::IsKeyPressed( key ), key == pressed );
    }

    // Out-of-range writes are ignored
    Input::Reset();
    Input::SetKeyPressed( Key::COUNT, true );
    for( Key key: keys )
        EXPECT_FALSE( Input::IsKeyPressed( key ) );
}

TEST_F( InputTest, DeltasResetEachFrame )
{
    Input::AddMouseDelta( 2.0f, -1.0f );
    Input::AddMouseDelta( 1.0f, 0.5f );
    Input::SetScrollY( 3.0f );

    auto [ dx, dy ] = Input::GetMouseDelta();
    EXPECT_FLOAT_EQ( dx, 3.0f );
    EXPECT_FLOAT_EQ( dy, -0.5f );
    EXPECT_FLOAT_EQ( Input::GetScrollY(), 3.0f );

    Input::BeginFrame();
    EXPECT_FLOAT_EQ( Input::GetMouseDelta().first, 0.0f );
    EXPECT_FLOAT_EQ( Input::GetScrollY(), 0.0f );
}

TEST_F( InputTest, ExitRequestIsClearedByReset )
{
    Input::RequestExit();
    EXPECT_TRUE( Input::IsExitRequested() );
    Input::Reset();
    EXPECT_FALSE( Input::IsExitRequested() );
}
