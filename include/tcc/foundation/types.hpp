#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared by every combat component.

#include <cstdint>
#include <functional>
#include <ostream>

namespace tcc::foundation {

/// Integer id that cannot be mixed up with an id of another kind.
///
/// A CombatantId is never accepted where a SessionId is expected. Zero is
/// the invalid id; a default-constructed id is invalid.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    using value_type = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

template <typename Tag, typename T>
std::ostream& operator<<(std::ostream& os, const StrongId<Tag, T>& id) {
    return os << '#' << id.value();
}

/// Hands out ids 1, 2, 3, ... for one owner. Ids are never reused.
///
/// Thread safety: None.
template <typename Id>
class IdAllocator {
public:
    [[nodiscard]] Id next() noexcept { return Id(counter_++); }
    [[nodiscard]] typename Id::value_type issued() const noexcept { return counter_ - 1; }

private:
    typename Id::value_type counter_ = 1;
};

struct CombatantIdTag {};
struct SessionIdTag {};

/// Identifies a combatant. The core never owns combatant data; grid
/// cells and registries only hold this id as a weak reference.
using CombatantId = StrongId<CombatantIdTag>;

using SessionId = StrongId<SessionIdTag>;

}  // namespace tcc::foundation

template <typename Tag, typename T>
struct std::hash<tcc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tcc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
