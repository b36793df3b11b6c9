// =============================================================================
// zone-config - Placement Constraint Implementation
// =============================================================================

#include "zcfg/zone/constraint.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace zcfg {

namespace {

[[nodiscard]] bool isTokenChar(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' ||
           c == ':' || c == '/' || c == '-';
}

[[nodiscard]] bool isValidPart(std::string_view part) noexcept {
    return !part.empty() && std::all_of(part.begin(), part.end(), isTokenChar);
}

}  // namespace

Result<Constraint> Constraint::fromString(std::string_view shortForm) {
    if (shortForm.empty()) {
        return makeError<Constraint>(ErrorCode::kParseError,
                                     "the empty string is not a valid constraint");
    }

    Constraint constraint;
    std::string_view body = shortForm;
    switch (body.front()) {
        case '+':
            constraint.type = Type::kRequired;
            body.remove_prefix(1);
            break;
        case '-':
            constraint.type = Type::kProhibited;
            body.remove_prefix(1);
            break;
        default:
            constraint.type = Type::kDeprecatedPositive;
            break;
    }

    auto eq = body.find('=');
    if (eq != std::string_view::npos && body.find('=', eq + 1) != std::string_view::npos) {
        return makeError<Constraint>(
            ErrorCode::kParseError,
            fmt::format("constraint needs to be in the form \"(key=)value\", not \"{}\"",
                        shortForm));
    }

    std::string_view key;
    std::string_view value = body;
    if (eq != std::string_view::npos) {
        key = body.substr(0, eq);
        value = body.substr(eq + 1);
        if (!isValidPart(key)) {
            return makeError<Constraint>(
                ErrorCode::kParseError,
                fmt::format("invalid constraint key in \"{}\"", shortForm));
        }
    }
    if (!isValidPart(value)) {
        return makeError<Constraint>(
            ErrorCode::kParseError,
            fmt::format("invalid constraint value in \"{}\"", shortForm));
    }

    constraint.key = std::string(key);
    constraint.value = std::string(value);
    return constraint;
}

std::string Constraint::toString() const {
    std::string out;
    switch (type) {
        case Type::kRequired:
            out += '+';
            break;
        case Type::kProhibited:
            out += '-';
            break;
        case Type::kDeprecatedPositive:
            break;
    }
    if (!key.empty()) {
        out += key;
        out += '=';
    }
    out += value;
    return out;
}

Constraint parseConstraint(std::string_view shortForm) {
    auto parsed = Constraint::fromString(shortForm);
    if (!parsed) {
        throw ParseError(parsed.error().message());
    }
    return std::move(*parsed);
}

}  // namespace zcfg
