// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-HFSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of HFSM (Hierarchical Finite State Machine Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#pragma once

#include <cstddef>

/**
 * @file Constants.h
 * @brief Engine-wide limits and defaults
 */

namespace HFSM::Constants {

/**
 * @brief Default number of ghost states one call chain may pass through
 *
 * Entering a ghost state re-evaluates its outgoing transitions immediately,
 * so a cycle of ghost states would recurse forever. Decision trees in
 * practice are a handful of levels deep.
 *
 * @see StateMachine::setMaxGhostChainLength
 */
constexpr size_t DEFAULT_MAX_GHOST_CHAIN_LENGTH = 32;

/**
 * @brief Name of the spdlog logger registered by the default backend
 */
constexpr const char *LOGGER_NAME = "HFSM";

}  // namespace HFSM::Constants
