#include "opaque_value.hpp"

#include "picosha2.h"

#include <sstream>

namespace bc {

namespace {

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

} // namespace

const char* toString(ClueField field) {
    switch (field) {
    case ClueField::Weapon:
        return "weapon";
    case ClueField::Room:
        return "room";
    case ClueField::Suspect:
        return "suspect";
    }
    return "unknown";
}

std::string deriveHandle(const std::string& domain,
                         const std::string& operation,
                         const std::vector<std::string>& operands) {
    std::ostringstream oss;
    oss << "handle:v1:";
    appendLengthPrefixed(oss, domain);
    appendLengthPrefixed(oss, operation);
    oss << operands.size() << ';';
    for (const auto& operand : operands) {
        appendLengthPrefixed(oss, operand);
    }
    std::string preimage = oss.str();
    return picosha2::hash256_hex_string(preimage);
}

} // namespace bc
