/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

namespace vista::vis {

    class ScalarBarRegistry;

    /// The plotting front end that owns renderers and schedules frames
    class RendererHost {
    public:
        virtual ~RendererHost() = default;

        // Fire-and-forget redraw request, may be coalesced. Called from
        // Renderer::Batch's destructor, so it must not throw.
        virtual void render() noexcept = 0;

        // Colorbars shared by every renderer of this host, nullptr if the host has none
        [[nodiscard]] virtual ScalarBarRegistry* scalarBars() = 0;
    };

} // namespace vista::vis
