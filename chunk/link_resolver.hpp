// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "chunk_link.hpp"

#include "utility/cv_wrapper.hpp"

#include <cstdint>

namespace chunks {

    // Source of fresh download links for chunks whose link is missing or expiring.
    class ILinkResolver {
    public:
        virtual ~ILinkResolver() = default;

        // Waitable result; released with an error when the link cannot be obtained.
        virtual shared_data<ChunkLink> resolveLink(uint64_t chunkIndex) = 0;

        // Fails every outstanding request. Later requests fail immediately.
        virtual void shutdown() {}
    };

} // namespace chunks
