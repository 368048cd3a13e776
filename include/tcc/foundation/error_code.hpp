#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat core.

#include <cstdint>
#include <string_view>

namespace tcc::foundation {

/// Error codes grouped by subsystem in 0x100-wide ranges.
///
/// The upper byte identifies the subsystem, so the source of an error
/// can be recovered from the numeric value alone (useful once a code has
/// been persisted or sent to a client by an outer layer).
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Rules (0x0900 - 0x09FF)
    InvalidDiceNotation = 0x0900,
    InvalidDieSize = 0x0901,
    InvalidArmorClass = 0x0902,
    UnknownPreset = 0x0903,
    RulesDataLoadFailed = 0x0904,
    UnknownWeapon = 0x0905,
    UnknownArmor = 0x0906,

    // Grid (0x0A00 - 0x0AFF)
    OutOfBounds = 0x0A00,
    CellNotPassable = 0x0A01,
    CellOccupied = 0x0A02,

    // Combat (0x0B00 - 0x0BFF)
    CombatantNotFound = 0x0B00,
    CombatantAlreadyPresent = 0x0B01,
    NotCombatantsTurn = 0x0B02,
    CombatEnded = 0x0B03,
    CorruptState = 0x0B04,

    // Session (0x0C00 - 0x0CFF)
    SessionNotFound = 0x0C00,
    SessionLimitReached = 0x0C01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Rules";
        case 0x0A00: return "Grid";
        case 0x0B00: return "Combat";
        case 0x0C00: return "Session";
        default: return "Unknown";
    }
}

} // namespace tcc::foundation
