#pragma once

/// @file tcc.hpp
/// @brief Convenience header pulling in the whole combat core.

#include "tcc/version.hpp"

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_logger.hpp"
#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/types.hpp"

#include "tcc/grid/combat_grid.hpp"
#include "tcc/grid/pathfinder.hpp"
#include "tcc/grid/tactical_queries.hpp"

#include "tcc/rules/combat_math.hpp"
#include "tcc/rules/dice.hpp"
#include "tcc/rules/resolution_engine.hpp"
#include "tcc/rules/rules_config.hpp"
#include "tcc/rules/rules_registry.hpp"

#include "tcc/reactions/reaction_registry.hpp"
#include "tcc/reactions/reaction_resolver.hpp"

#include "tcc/status/death_saves.hpp"
#include "tcc/status/exhaustion.hpp"

#include "tcc/session/combat_session.hpp"
#include "tcc/session/session_store.hpp"
