/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "rendering/prop.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vista::vis {

    /**
     * @brief Name to prop mapping of one renderer.
     *
     * Keys are unique and entries keep their insertion order. Every mutation
     * bumps generation(), which derived caches use to detect staleness.
     */
    class VISTA_VIS_API ActorRegistry {
    public:
        struct Entry {
            std::string name;
            std::shared_ptr<rendering::Prop> prop;
        };

        ActorRegistry() = default;

        // Stores the prop under name, overwriting an entry of the same name
        void insert(const std::string& name, std::shared_ptr<rendering::Prop> prop);

        // Returns the removed prop, or nullptr if the name was absent
        std::shared_ptr<rendering::Prop> erase(std::string_view name);

        void clear();

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] std::shared_ptr<rendering::Prop> find(std::string_view name) const;
        [[nodiscard]] std::optional<std::string> nameOf(const rendering::Prop& prop) const;

        // Names of the form "<name>-<suffix>", in insertion order
        [[nodiscard]] std::vector<std::string> groupMembers(std::string_view name) const;

        // Key derived from the prop identity, unique within this registry
        [[nodiscard]] std::string uniqueName(const rendering::Prop& prop) const;

        [[nodiscard]] std::vector<std::string> names() const;
        [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] bool empty() const { return entries_.empty(); }
        [[nodiscard]] uint64_t generation() const { return generation_; }

    private:
        void rebuildIndex();

        std::vector<Entry> entries_;
        std::unordered_map<std::string, size_t> index_;
        uint64_t generation_ = 0;
    };

} // namespace vista::vis
