#pragma once

#include <mentat/agent/agent.h>

/**
 * @file cli.h
 * @brief Command-line entry point for the mentat_agent binary.
 */

namespace mentat::cli
{

inline constexpr int kExitUsage = 2;

/** @brief Run the CLI using argc/argv and the default echo transform; returns the exit code. */
int run(int argc, char** argv);

/**
 * @brief Run the CLI with caller-supplied agent options.
 *
 * Agents built from this template call this from their own `main` with their
 * transform plugged into `options`.
 */
int run(int argc, char** argv, const agent::Options& options);

} // namespace mentat::cli
