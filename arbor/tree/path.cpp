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
#include <arbor/tree/path.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

ARBOR_NAMESPACE_BEGIN

Path::Path(std::vector<std::string> args)
    : args_{std::move(args)}
{
}

Path::Path(std::initializer_list<std::string_view> const args)
{
    args_.reserve(args.size());
    for (auto const &arg : args) {
        args_.emplace_back(arg);
    }
}

Path Path::parse(std::string_view s)
{
    std::vector<std::string> args;
    while (!s.empty()) {
        auto const pos = s.find('/');
        auto const arg = s.substr(0, pos);
        if (!arg.empty()) {
            args.emplace_back(arg);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        s.remove_prefix(pos + 1);
    }
    return Path{std::move(args)};
}

std::string const &Path::last() const
{
    ARBOR_ASSERT(!args_.empty());
    return args_.back();
}

Path Path::child(std::string_view const arg) const
{
    auto args = args_;
    args.emplace_back(arg);
    return Path{std::move(args)};
}

Path Path::parent() const
{
    ARBOR_ASSERT(!args_.empty());
    return Path{std::vector<std::string>{args_.begin(), args_.end() - 1}};
}

bool Path::starts_with(Path const &prefix) const noexcept
{
    return prefix.args_.size() <= args_.size() &&
           std::equal(
               prefix.args_.begin(), prefix.args_.end(), args_.begin());
}

bool Path::has_wildcard() const noexcept
{
    return std::ranges::any_of(
        args_, [](std::string const &arg) { return arg == WILDCARD; });
}

std::string Path::to_string() const
{
    if (args_.empty()) {
        return "/";
    }
    std::string out;
    for (auto const &arg : args_) {
        out.push_back('/');
        out.append(arg);
    }
    return out;
}

bool matches(Path const &pattern, Path const &path) noexcept
{
    if (pattern.size() != path.size()) {
        return false;
    }
    for (size_t i = 0; i < path.size(); ++i) {
        auto const &p = pattern.args()[i];
        if (p != Path::WILDCARD && p != path.args()[i]) {
            return false;
        }
    }
    return true;
}

ARBOR_NAMESPACE_END
