#pragma once

#include "boxmeta/box_tree.h"
#include "boxmeta/byte_source.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for decoding untrusted box-structured input.
 */

namespace boxmeta {

/**
 * \brief Storage-agnostic resource limits for one decode session.
 *
 * Favors decode budgets over hard file-size caps, so large legitimate media
 * files still decode when the structural limits are respected.
 */
struct BoxMetaResourcePolicy final {
    /// Optional file mapping cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Forward-only stream buffering budgets.
    SourceLimits source_limits;

    /// Box tree decode budgets.
    BoxDecodeLimits box_limits;
};

inline void
apply_resource_policy(const BoxMetaResourcePolicy& policy,
                      SourceLimits* source, BoxDecodeOptions* decode) noexcept
{
    if (source) {
        *source = policy.source_limits;
    }
    if (decode) {
        decode->limits = policy.box_limits;
    }
}

}  // namespace boxmeta
