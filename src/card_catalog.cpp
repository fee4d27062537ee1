#include "card_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace bc {

namespace {

const std::vector<std::string>& deck(ClueField field) {
    static const std::vector<std::string> kWeapons = {
        "Candlestick", "Dagger", "Lead Pipe", "Revolver", "Rope", "Wrench"
    };
    static const std::vector<std::string> kRooms = {
        "Kitchen", "Ballroom", "Conservatory", "Dining Room", "Billiard Room",
        "Library", "Lounge", "Hall", "Study"
    };
    static const std::vector<std::string> kSuspects = {
        "Miss Scarlet", "Colonel Mustard", "Mrs. White", "Mr. Green", "Mrs. Peacock", "Professor Plum"
    };
    switch (field) {
    case ClueField::Weapon:
        return kWeapons;
    case ClueField::Room:
        return kRooms;
    case ClueField::Suspect:
        return kSuspects;
    }
    throw std::invalid_argument("unknown clue field");
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::size_t cardCount(ClueField field) {
    return deck(field).size();
}

const std::string& cardName(ClueField field, std::uint64_t index) {
    const auto& cards = deck(field);
    if (index >= cards.size()) {
        throw std::out_of_range(std::string("no ") + toString(field) + " card at index " +
                                std::to_string(index));
    }
    return cards[static_cast<std::size_t>(index)];
}

std::optional<std::uint64_t> findCard(ClueField field, const std::string& name) {
    const auto& cards = deck(field);
    for (std::size_t i = 0; i < cards.size(); ++i) {
        if (equalsIgnoreCase(cards[i], name)) {
            return static_cast<std::uint64_t>(i);
        }
    }
    return std::nullopt;
}

std::string describeCard(ClueField field, std::uint64_t value) {
    if (value < cardCount(field)) {
        return cardName(field, value);
    }
    return std::to_string(value);
}

} // namespace bc
