/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/actor_registry.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace vista::vis {

    namespace {
        std::string_view kind_name(const rendering::PropKind kind) {
            switch (kind) {
            case rendering::PropKind::Actor: return "Actor";
            case rendering::PropKind::CubeAxes: return "CubeAxesActor";
            case rendering::PropKind::AxesMarker: return "AxesMarker";
            case rendering::PropKind::ScalarBar: return "ScalarBarActor";
            case rendering::PropKind::Border2D: return "Border2D";
            }
            return "Prop";
        }
    } // namespace

    void ActorRegistry::insert(const std::string& name, std::shared_ptr<rendering::Prop> prop) {
        if (const auto it = index_.find(name); it != index_.end()) {
            LOG_DEBUG("Overwriting registry entry '{}'", name);
            entries_[it->second].prop = std::move(prop);
        } else {
            index_.emplace(name, entries_.size());
            entries_.push_back({name, std::move(prop)});
        }
        ++generation_;
        LOG_TRACE("Registered '{}' ({} entries)", name, entries_.size());
    }

    std::shared_ptr<rendering::Prop> ActorRegistry::erase(const std::string_view name) {
        const auto it = index_.find(std::string(name));
        if (it == index_.end())
            return nullptr;

        const size_t position = it->second;
        auto prop = std::move(entries_[position].prop);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
        rebuildIndex();
        ++generation_;
        LOG_TRACE("Unregistered '{}' ({} entries)", name, entries_.size());
        return prop;
    }

    void ActorRegistry::clear() {
        if (entries_.empty())
            return;
        entries_.clear();
        index_.clear();
        ++generation_;
    }

    bool ActorRegistry::contains(const std::string_view name) const {
        return index_.contains(std::string(name));
    }

    std::shared_ptr<rendering::Prop> ActorRegistry::find(const std::string_view name) const {
        const auto it = index_.find(std::string(name));
        return it == index_.end() ? nullptr : entries_[it->second].prop;
    }

    std::optional<std::string> ActorRegistry::nameOf(const rendering::Prop& prop) const {
        const auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.prop.get() == &prop; });
        if (it == entries_.end())
            return std::nullopt;
        return it->name;
    }

    std::vector<std::string> ActorRegistry::groupMembers(const std::string_view name) const {
        const std::string prefix = fmt::format("{}-", name);
        std::vector<std::string> members;
        for (const auto& entry : entries_) {
            if (entry.name.starts_with(prefix))
                members.push_back(entry.name);
        }
        return members;
    }

    std::string ActorRegistry::uniqueName(const rendering::Prop& prop) const {
        const std::string base = fmt::format("{}({:#x})", kind_name(prop.kind()), prop.id());
        if (!contains(base))
            return base;
        // Only reachable if a caller chose this key explicitly
        for (size_t n = 2;; ++n) {
            std::string candidate = fmt::format("{}_{}", base, n);
            if (!contains(candidate))
                return candidate;
        }
    }

    std::vector<std::string> ActorRegistry::names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_)
            out.push_back(entry.name);
        return out;
    }

    void ActorRegistry::rebuildIndex() {
        index_.clear();
        for (size_t i = 0; i < entries_.size(); ++i)
            index_.emplace(entries_[i].name, i);
    }

} // namespace vista::vis
