/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "PathUtils.h"

namespace Stevedore::Core::Operations::PathUtils {

std::string trimTrailingSeparators(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::vector<std::string> prefixes(const std::string& path) {
    std::vector<std::string> out;
    std::string current;
    if (!path.empty() && path.front() == '/') {
        current = "/";
    }

    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) {
            if (!current.empty() && current.back() != '/') current += '/';
            current.append(path, start, end - start);
            out.push_back(current);
        }
        start = end + 1;
    }
    return out;
}

std::optional<std::string> translatePath(const std::string& path, const std::string& srcRoot, const std::string& dstRoot) {
    const std::string src = trimTrailingSeparators(srcRoot);
    const std::string dst = trimTrailingSeparators(dstRoot);

    std::string relative;
    if (src.empty() || src == "/") {
        relative = path.substr(src.size());
    } else if (path == src) {
        return dst;
    } else if (path.size() > src.size() && path.compare(0, src.size(), src) == 0 && path[src.size()] == '/') {
        relative = path.substr(src.size() + 1);
    } else {
        return std::nullopt;
    }

    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    relative = trimTrailingSeparators(relative);

    if (relative.empty()) return dst;
    if (dst.empty()) return relative;
    if (dst == "/") return dst + relative;
    return dst + "/" + relative;
}

bool isSameOrAncestor(const std::string& candidate, const std::string& path) {
    const std::string c = trimTrailingSeparators(candidate);
    const std::string p = trimTrailingSeparators(path);
    if (c.empty() || c == p) return true;
    if (c == "/") return !p.empty() && p.front() == '/';
    return p.size() > c.size() && p.compare(0, c.size(), c) == 0 && p[c.size()] == '/';
}

} // namespace Stevedore::Core::Operations::PathUtils
