#pragma once

// Diorama - Scroll-driven 3D model viewer
// Main include file

#include <diorama/scene_node.h>
#include <diorama/material.h>
#include <diorama/model_asset.h>
#include <diorama/event_queue.h>
#include <diorama/mesh_source.h>
#include <diorama/gltf_mesh_source.h>
#include <diorama/progress_display.h>
#include <diorama/model_preparer.h>
#include <diorama/lighting_rig.h>
#include <diorama/scene_registry.h>
#include <diorama/section_layout.h>
#include <diorama/scroll_state_machine.h>
#include <diorama/asset_loader.h>
#include <diorama/camera.h>
#include <diorama/render_loop.h>
#include <diorama/config.h>
#include <diorama/viewer.h>
