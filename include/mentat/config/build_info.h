#pragma once

#include <string_view>

/**
 * @file build_info.h
 * @brief Values fixed when the agent is built.
 *
 * Each generated agent is configured with its own identifier through the
 * MENTAT_AGENT_ID CMake cache variable; it is never read at run time.
 */

namespace mentat::config
{

/** @brief Identifier reported as `mentat_meta.model` in every response. */
[[nodiscard]] std::string_view agent_id();

/** @brief Project version (semver). */
[[nodiscard]] std::string_view version();

/** @brief Short git sha of the build, or "unknown". */
[[nodiscard]] std::string_view git_sha();

/** @brief CMake build type, or "unknown". */
[[nodiscard]] std::string_view build_type();

} // namespace mentat::config
