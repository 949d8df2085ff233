#pragma once
#include "core/Base.hpp"
#include "renderer/Framebuffer.hpp"
#include <filesystem>

namespace SpaceRaster
{
    /**
     * @brief Presents finished frames as binary PPM (P6) images.
     */
    class ImageWriter
    {
    public:
        // "P6\n<w> <h>\n255\n" followed by the RGB24 pixels, top row first
        static std::vector<uint8_t> EncodePPM( const Framebuffer& framebuffer );

        static Result WritePPM( const Framebuffer& framebuffer, const std::filesystem::path& path );
    };
} // namespace SpaceRaster
