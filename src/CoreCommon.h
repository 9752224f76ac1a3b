/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Debug assertions and the environment readers behind the
 *        STEVEDORE_* variables (see BlockPool::Config::fromEnvironment,
 *        OperationSession and the global Logger)
 */

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>

#ifdef StevedoreDebug
#undef NDEBUG
#define STEVEDORE_ASSERT(condition, message) assert((condition) && (message))
#else
#define STEVEDORE_ASSERT(condition, message) ((void)0)
#endif

namespace Stevedore::Core {

/// Copy of an environment variable, or nullopt when it is not set
inline std::optional<std::string> safeGetEnv(const char* name) {
    if (!name) return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    size_t length = 0;
    if (_dupenv_s(&raw, &length, name) != 0 || !raw) return std::nullopt;
    std::string copy(raw);
    std::free(raw);
    return copy;
#else
    if (const char* raw = std::getenv(name)) return std::string(raw);
    return std::nullopt;
#endif
}

/// Base-10 integer; nullopt if unset, empty or trailed by junk
inline std::optional<int64_t> safeGetEnvInt(const char* name) {
    const auto text = safeGetEnv(name);
    if (!text || text->empty()) return std::nullopt;
    const char* begin = text->c_str();
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(begin, &end, 10);
    if (errno == ERANGE || end == begin || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(value);
}

/// Accepts 1/0, true/false, yes/no, on/off in any case
inline std::optional<bool> safeGetEnvBool(const char* name) {
    auto text = safeGetEnv(name);
    if (!text) return std::nullopt;
    std::transform(text->begin(), text->end(), text->begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* yes : {"1", "true", "yes", "on"}) {
        if (*text == yes) return true;
    }
    for (const char* no : {"0", "false", "no", "off"}) {
        if (*text == no) return false;
    }
    return std::nullopt;
}

} // namespace Stevedore::Core
