// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <arbor/core/assert.h>
#include <arbor/core/config.hpp>
#include <arbor/shard/tree_change_listener.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/fmt/path_fmt.hpp>
#include <arbor/tree/path.hpp>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

ARBOR_NAMESPACE_BEGIN

ListenerRegistration::ListenerRegistration(std::function<void()> close)
    : close_{std::move(close)}
{
}

void ListenerRegistration::close()
{
    if (close_) {
        auto close = std::move(close_);
        close_ = nullptr;
        close();
    }
}

uint64_t TreeChangePublisher::add(
    Path path, std::shared_ptr<TreeChangeListener> listener)
{
    ARBOR_ASSERT(listener);
    auto const id = next_id_++;
    LOG_DEBUG("Registering tree change listener {} on {}", id, path);
    registrations_.emplace(id, Registration{std::move(path), std::move(listener)});
    return id;
}

void TreeChangePublisher::remove(uint64_t const id)
{
    LOG_DEBUG("Closing tree change listener {}", id);
    registrations_.erase(id);
}

void TreeChangePublisher::publish(Candidate const &candidate) const
{
    // a listener may close its own registration while being notified
    auto const registrations = registrations_;
    for (auto const &[id, registration] : registrations) {
        auto const changes = match_candidates(candidate, registration.path);
        if (!changes.empty()) {
            registration.listener->on_tree_changed(changes);
        }
    }
}

ARBOR_NAMESPACE_END
