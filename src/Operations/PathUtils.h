/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace Stevedore::Core::Operations::PathUtils {

// Strips trailing '/' (a lone "/" is kept)
std::string trimTrailingSeparators(std::string path);

/**
 * @brief Every leading sub-path of path, shortest first
 *
 * "a/b/c" -> {"a", "a/b", "a/b/c"}; "/tmp/x" -> {"/tmp", "/tmp/x"}.
 * Repeated separators are collapsed.
 */
std::vector<std::string> prefixes(const std::string& path);

/**
 * @brief Maps a path under srcRoot to the same relative position under dstRoot
 *
 * An empty dstRoot yields the bare relative path (no leading '/'); the root
 * itself maps to dstRoot.
 *
 * @return nullopt if path is not srcRoot or below it
 */
std::optional<std::string> translatePath(const std::string& path, const std::string& srcRoot, const std::string& dstRoot);

// True if candidate equals path or is one of its ancestors (component-wise)
bool isSameOrAncestor(const std::string& candidate, const std::string& path);

} // namespace Stevedore::Core::Operations::PathUtils
