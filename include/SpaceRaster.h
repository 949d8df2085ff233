#pragma once

// Public entry point of the SpaceRaster software renderer.
#include "core/Base.hpp"
#include "core/FileSystem.hpp"
#include "core/Log.hpp"
#include "core/TimeController.hpp"
#include "core/Timer.hpp"
#include "math/Noise.hpp"
#include "platform/ImageWriter.hpp"
#include "platform/Input.hpp"
#include "renderer/Camera.hpp"
#include "renderer/Color.hpp"
#include "renderer/Framebuffer.hpp"
#include "renderer/PipelineTypes.hpp"
#include "renderer/Renderer.hpp"
#include "renderer/Shading.hpp"
#include "resources/Mesh.hpp"
#include "resources/ShapeGenerator.hpp"
