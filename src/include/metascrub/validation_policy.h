#pragma once

#include "metascrub/path_guard.h"

/**
 * \file validation_policy.h
 * \brief Runtime validation settings supplied by the application layer.
 */

namespace metascrub {

/**
 * \brief Settings the validation core consumes from the application.
 *
 * Read once at startup by the settings owner and handed to
 * \ref ValidationPipeline. Size ceilings, probe length and the signature
 * table are compiled in and cannot be changed here.
 */
struct ValidationPolicy final {
    /// "Allow symlinks in non-production mode". Off in production builds.
    bool allow_symlinks_in_development = false;
};

/// Maps the settings flag to the symlink handling policy.
constexpr SymlinkPolicy
symlink_policy_for(const ValidationPolicy& policy) noexcept
{
    return policy.allow_symlinks_in_development
               ? SymlinkPolicy::ResolveAndRevalidate
               : SymlinkPolicy::Reject;
}

}  // namespace metascrub
