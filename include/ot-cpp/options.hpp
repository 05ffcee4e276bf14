/// @file options.hpp
/// @brief ServiceOptions: configuration for a CollaborationService.

#pragma once

#include <ot-cpp/capability.hpp>

#include <string>

namespace ot_cpp {

/// Configuration for a CollaborationService.
///
/// Loadable from JSON with load_options() (see json.hpp):
/// @code
/// { "delivery_threads": 4, "default_role": "viewer", "log_level": "info" }
/// @endcode
struct ServiceOptions {
    /// Threads used to process server messages in sessions.
    /// 1 processes them on the committing thread, 0 uses one thread per
    /// hardware core, N uses a pool of N threads.
    unsigned int delivery_threads{1};

    /// Role of clients that have no explicit grant on a document.
    Role default_role{Role::viewer};

    /// spdlog level name applied when the service starts; empty keeps the
    /// current level.
    std::string log_level{};

    auto operator==(const ServiceOptions&) const -> bool = default;
};

}  // namespace ot_cpp
