#ifndef POKER_EQUITY_COMMON_TYPES_H
#define POKER_EQUITY_COMMON_TYPES_H

#include <array>
#include "core/cards.hpp"

namespace poker_equity {

// Deux cartes privées (un joueur ou une entrée de range)
using HoleCards = std::array<Card, 2>;

// Actions recommandées par la couche stratégie
enum class ActionType {
    FOLD,
    CHECK,
    CALL
};

inline const char* action_to_string(ActionType action) {
    switch (action) {
        case ActionType::FOLD:  return "fold";
        case ActionType::CHECK: return "check";
        case ActionType::CALL:  return "call";
        default:                return "unknown";
    }
}

} // namespace poker_equity

#endif // POKER_EQUITY_COMMON_TYPES_H
