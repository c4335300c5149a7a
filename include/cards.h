#ifndef POKER_COACH_CARDS_H
#define POKER_COACH_CARDS_H

#include <cstdint> // For uint8_t
#include <string>
#include <vector>

namespace poker_coach {

// Represents a playing card (e.g., 'Ah', 'Td', '2c')
using Card = std::string;

// Betting rounds. SHOWDOWN is only used for finished live hands.
enum class Street : uint8_t {
    PREFLOP,
    FLOP,
    TURN,
    RIVER,
    SHOWDOWN
};

std::string street_to_string(Street street);
// Throws ConfigError on an unknown name.
Street street_from_string(const std::string& name);
// Number of community cards visible on a street (0, 3, 4, 5).
int board_card_count(Street street);
// Street implied by the number of revealed board cards.
Street street_for_board_size(size_t board_cards);

// Rank value 2..14 (A = 14), 0 if unknown.
int card_rank(const Card& card);
// Suit character ('c', 'd', 'h', 's'), '?' if unknown.
char card_suit(const Card& card);
bool is_valid_card(const Card& card);

// Normalizes "ah", "AH", "10h", "A♥", "A hearts" to "Ah". Returns "??" when
// the input cannot be read as a card.
Card normalize_card(const std::string& raw);

// The 52 cards in rank-major order (2c, 2d, 2h, 2s, 3c, ...).
const std::vector<Card>& full_deck();

// Removes the given cards from a deck copy.
std::vector<Card> remove_cards(const std::vector<Card>& deck, const std::vector<Card>& dead);

// Canonical combo class such as "AKs", "T9o", "77".
std::string combo_class(const Card& a, const Card& b);

// Heuristic preflop strength in [0, 100].
double preflop_strength_score(const Card& a, const Card& b);

// How coordinated a board is: suits, connectedness and pairing.
double board_texture_score(const std::vector<Card>& board);
// "dry", "semi-wet" or "wet".
std::string texture_label(double texture);

} // namespace poker_coach

#endif // POKER_COACH_CARDS_H
