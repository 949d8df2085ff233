#pragma once
#include "core/Base.hpp"
#include <filesystem>
#include <string>

namespace SpaceRaster
{
    /**
     * @brief Centralized system for resolving output file paths.
     * Every frame dump and report is written relative to a single root directory.
     */
    class FileSystem
    {
    public:
        /**
         * @brief Sets the root directory and creates it if missing.
         * @param root Directory to write into. Relative paths resolve against the working directory.
         */
        static Result Init( const std::filesystem::path& root );

        /**
         * @brief Resolves a relative path to a full path under the root.
         * @param path The relative path (e.g., "frame_0001.ppm")
         */
        static std::filesystem::path GetPath( const std::string& path );

        static const std::filesystem::path& GetRoot();

        static bool IsInitialized() { return !s_rootDirectory.empty(); }

    private:
        static std::filesystem::path s_rootDirectory;
    };
} // namespace SpaceRaster
