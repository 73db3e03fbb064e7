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

#pragma once

#include <arbor/core/config.hpp>
#include <arbor/tree/candidate.hpp>
#include <arbor/tree/path.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

ARBOR_NAMESPACE_BEGIN

class TreeChangeListener
{
public:
    virtual ~TreeChangeListener() = default;

    // One call per commit, candidates rooted at the changed registered paths
    virtual void on_tree_changed(std::vector<Candidate> const &) = 0;
};

// Handle returned on registration. Closing it stops further notifications.
class ListenerRegistration
{
    std::function<void()> close_;

public:
    ListenerRegistration() = default;
    explicit ListenerRegistration(std::function<void()> close);

    ListenerRegistration(ListenerRegistration &&) = default;
    ListenerRegistration &operator=(ListenerRegistration &&) = default;

    void close();

    bool is_closed() const noexcept
    {
        return !close_;
    }
};

class TreeChangePublisher
{
    struct Registration
    {
        Path path;
        std::shared_ptr<TreeChangeListener> listener;
    };

    std::map<uint64_t, Registration> registrations_;
    uint64_t next_id_{0};

public:
    uint64_t add(Path path, std::shared_ptr<TreeChangeListener>);
    void remove(uint64_t id);

    size_t size() const noexcept
    {
        return registrations_.size();
    }

    void publish(Candidate const &) const;
};

ARBOR_NAMESPACE_END
