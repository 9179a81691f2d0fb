#pragma once

// Flowmap - Main header
// Include this from the host adapter

#include <flowmap/types.h>
#include <flowmap/run_loop.h>
#include <flowmap/host_map.h>
#include <flowmap/animation_clock.h>
#include <flowmap/animation_runner.h>
#include <flowmap/animation_batcher.h>
#include <flowmap/performance_monitor.h>
#include <flowmap/layer_registry.h>
#include <flowmap/trips.h>
#include <flowmap/overlay_manager.h>
#include <flowmap/camera_sync.h>
#include <flowmap/config.h>
#include <flowmap/animation_overlay.h>
