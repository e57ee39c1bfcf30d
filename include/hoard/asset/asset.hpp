#pragma once

/// @file asset.hpp
/// @brief Main include file for hoard_asset
///
/// hoard_asset is a generic asset cache:
/// - Pluggable loaders keyed by extension and result type
/// - Single-flight synchronous and asynchronous loading
/// - Reference-counted handles with LRU, Manual and Aggressive policies
/// - Background streaming and hot reload
///
/// @section usage Basic Usage
/// @code
/// #include <hoard/asset/asset.hpp>
///
/// using namespace hoard_asset;
///
/// AssetManager manager(AssetManagerConfig::defaults()
///     .with_root_path("assets")
///     .with_cache_policy(CachePolicy::Aggressive));
///
/// manager.register_loader(std::make_shared<MeshLoader>());
///
/// auto mesh = manager.load<Mesh>("models/crate.mesh");
/// if (!mesh) {
///     HOARD_LOG_ERROR("{}", hoard_core::build_error_chain(mesh.error()));
///     return;
/// }
/// draw(*mesh.value());
///
/// // Preload a level in the background
/// StreamingManager streaming(manager);
/// streaming.queue_many<Mesh>({"models/a.mesh", "models/b.mesh"});
/// streaming.start(2);
/// streaming.wait_for_completion();
/// @endcode

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "loader.hpp"
#include "handle.hpp"
#include "task_pool.hpp"
#include "manifest.hpp"
#include "manager.hpp"
#include "streaming.hpp"
#include "watcher.hpp"
#include "reload.hpp"
#include <hoard/core/error.hpp>
#include <hoard/core/log.hpp>
