#include "platform/ImageWriter.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

using namespace SpaceRaster;

TEST( ImageWriterTests, EncodesBinaryPPM )
{
    Framebuffer fb( 3, 2, Color( 9, 8, 7 ) );
    fb.TestAndWrite( 2, 1, 0.5f, Color( 1, 2, 3 ) );

    std::vector<uint8_t> bytes  = ImageWriter::EncodePPM( fb );
    const std::string    header = "P6\n3 2\n255\n";
    ASSERT_EQ( bytes.size(), header.size() + 3 * 2 * 3 );
    EXPECT_EQ( std::string( bytes.begin(), bytes.begin() + header.size() ), header );

    EXPECT_EQ( bytes[ header.size() ], 9 );
    EXPECT_EQ( bytes[ bytes.size() - 3 ], 1 );
    EXPECT_EQ( bytes[ bytes.size() - 1 ], 3 );
}

TEST( ImageWriterTests, WritesFileToDisk )
{
    std::filesystem::path dir = std::filesystem::current_path() / "temp_image_test";
    std::filesystem::create_directories( dir );
    std::filesystem::path file = dir / "frame.ppm";

    Framebuffer fb( 4, 4, Color::White() );
    ASSERT_EQ( ImageWriter::WritePPM( fb, file ), Result::SUCCESS );

    std::ifstream        in( file, std::ios::binary );
    std::vector<uint8_t> read( ( std::istreambuf_iterator<char>( in ) ), std::istreambuf_iterator<char>() );
    EXPECT_EQ( read, ImageWriter::EncodePPM( fb ) );

    in.close();
    std::filesystem::remove_all( dir );
}

TEST( ImageWriterTests, ReportsUnwritablePaths )
{
    Framebuffer fb( 2, 2 );
    EXPECT_EQ( ImageWriter::WritePPM( fb, "" ), Result::INVALID_ARGS );
    EXPECT_EQ( ImageWriter::WritePPM( fb, std::filesystem::current_path() / "no_such_dir_sr" / "x" / "frame.ppm" ), Result::FAIL );
}
