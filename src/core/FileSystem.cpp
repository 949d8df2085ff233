#include "core/FileSystem.hpp"

#include "core/Log.hpp"
#include <system_error>

namespace SpaceRaster
{
    std::filesystem::path FileSystem::s_rootDirectory;

    Result FileSystem::Init( const std::filesystem::path& root )
    {
        if( root.empty() )
        {
            SR_CORE_ERROR( "FileSystem: Empty root directory." );
            return Result::INVALID_ARGS;
        }

        std::filesystem::path resolved = root.is_absolute() ? root : std::filesystem::current_path() / root;

        std::error_code ec;
        if( !std::filesystem::exists( resolved, ec ) )
        {
            std::filesystem::create_directories( resolved, ec );
            if( ec )
            {
                SR_CORE_CRITICAL( "FileSystem: Could not create '{}': {}", resolved.string(), ec.message() );
                return Result::FAIL;
            }
        }
        else if( !std::filesystem::is_directory( resolved, ec ) )
        {
            SR_CORE_ERROR( "FileSystem: '{}' exists and is not a directory.", resolved.string() );
            return Result::FAIL;
        }

        s_rootDirectory = resolved;
        SR_CORE_INFO( "FileSystem: Output root: '{}'", s_rootDirectory.string() );
        return Result::SUCCESS;
    }

    std::filesystem::path FileSystem::GetPath( const std::string& path )
    {
        // Operator / in std::filesystem automatically handles separator slashes
        return s_rootDirectory / path;
    }

    const std::filesystem::path& FileSystem::GetRoot()
    {
        return s_rootDirectory;
    }

} // namespace SpaceRaster
