#include "OrreryScene.hpp"

#include <runtime/EntryPoint.hpp>

SpaceRaster::Scene* SpaceRaster::CreateScene()
{
    return new Orrery::OrreryScene();
}
