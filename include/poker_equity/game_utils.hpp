#ifndef POKER_EQUITY_GAME_UTILS_HPP
#define POKER_EQUITY_GAME_UTILS_HPP

#include "poker_equity/common_types.h"
#include "core/cards.hpp"
#include <string>
#include <vector>

namespace poker_equity {

// "[As Kd Qh]"
std::string vec_to_string(const std::vector<Card>& cards);

// "AsKd"
std::string hole_cards_to_string(const HoleCards& hole);

// Développe une range en notation standard vers ses combinaisons.
//   "QQ"  -> 6 paires, "AKs" -> 4 assorties, "AKo" -> 12 dépareillées,
//   "AK"  -> 16 combinaisons, "AsKd" -> une main précise.
// Les tokens sont séparés par des virgules et/ou des espaces.
// Les combinaisons en double sont retirées (premier ordre conservé).
std::vector<HoleCards> parse_range(const std::string& range);

} // namespace poker_equity

#endif // POKER_EQUITY_GAME_UTILS_HPP
