#pragma once

/// @file release.hpp
/// @brief Main include file for forge_release module
///
/// forge_release turns a project of addon folders into a signed release tree:
/// - Addon naming rules, locations and destination paths
/// - Project descriptor (forge.json) loading
/// - Persistent or ephemeral signing keys
/// - Parallel packing and signing with per-addon failure isolation
///
/// @section usage Basic Usage
/// @code
/// #include <addon_forge/release/release.hpp>
///
/// using namespace forge_release;
///
/// auto root = find_project_root(std::filesystem::current_path());
/// auto project = ProjectDescriptor::load(*root / k_project_file_name);
///
/// auto overlay = VirtualFileOverlay::over(*root);
/// auto packed = pack_addons(*project, *root, overlay, my_packer, jobs);
///
/// DigestSigner signer;
/// auto context = prepare_release(*project, *root, "1.2.0");
/// auto summary = build_release(*context, *project, signer, jobs);
/// for (const auto& failure : summary->failures) {
///     spdlog::error("{}", failure.describe());
/// }
/// @endcode

#include "fwd.hpp"
#include "addon.hpp"
#include "project.hpp"
#include "keys.hpp"
#include "signer.hpp"
#include "overlay.hpp"
#include "layout.hpp"
#include "summary.hpp"
#include "worker_pool.hpp"
#include "packer.hpp"
#include "orchestrator.hpp"
