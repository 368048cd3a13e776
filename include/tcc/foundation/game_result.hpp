#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used across the combat core.

#include "tcc/core/result.hpp"
#include "tcc/foundation/game_error.hpp"

namespace tcc::foundation {

/// Result specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int> parseBonus(std::string_view text) {
///       if (text.empty()) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::InvalidArgument, "empty bonus"));
///       }
///       return GameResult<int>::ok(2);
///   }
/// @endcode
template <typename T>
using GameResult = tcc::Result<T, GameError>;

}  // namespace tcc::foundation
