#include "platform/ImageWriter.hpp"

#include <fstream>
#include <string>

namespace SpaceRaster
{
    std::vector<uint8_t> ImageWriter::EncodePPM( const Framebuffer& framebuffer )
    {
        std::string header = "P6\n" + std::to_string( framebuffer.GetWidth() ) + " " + std::to_string( framebuffer.GetHeight() ) + "\n255\n";

        std::vector<uint8_t> pixels = framebuffer.ToRGB24();
        std::vector<uint8_t> bytes;
        bytes.reserve( header.size() + pixels.size() );
        bytes.insert( bytes.end(), header.begin(), header.end() );
        bytes.insert( bytes.end(), pixels.begin(), pixels.end() );
        return bytes;
    }

    Result ImageWriter::WritePPM( const Framebuffer& framebuffer, const std::filesystem::path& path )
    {
        if( path.empty() )
            return Result::INVALID_ARGS;

        std::ofstream file( path, std::ios::binary | std::ios::trunc );
        if( !file.is_open() )
        {
            SR_CORE_ERROR( "Failed to open image file: {0}", path.string() );
            return Result::FAIL;
        }

        std::vector<uint8_t> bytes = EncodePPM( framebuffer );
        file.write( reinterpret_cast<const char*>( bytes.data() ), static_cast<std::streamsize>( bytes.size() ) );
        if( !file )
        {
            SR_CORE_ERROR( "Failed to write image file: {0}", path.string() );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }
} // namespace SpaceRaster
