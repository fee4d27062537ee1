#pragma once

#include "opaque_value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bc {

std::size_t cardCount(ClueField field);

// Throws std::out_of_range for an index past the field's deck.
const std::string& cardName(ClueField field, std::uint64_t index);

// Case-insensitive exact match.
std::optional<std::uint64_t> findCard(ClueField field, const std::string& name);

// Name when the value is a valid index, otherwise the number itself.
std::string describeCard(ClueField field, std::uint64_t value);

} // namespace bc
