// =============================================================================
// zone-config - Placement Constraint
// =============================================================================
// A single placement directive and its canonical short string form.
//
// Grammar of the short form:
//   constraint := [ '+' | '-' ] [ key '=' ] value
//   key, value := 1*( ALPHA / DIGIT / '_' / '.' / ':' / '/' / '-' )
//
// '+' marks a required constraint, '-' a prohibited one. A token without a
// prefix is a deprecated positive constraint, kept for old documents.
// =============================================================================

#ifndef ZCFG_ZONE_CONSTRAINT_H
#define ZCFG_ZONE_CONSTRAINT_H

#include <cstdint>
#include <string>
#include <string_view>

#include "zcfg/common/error.h"

namespace zcfg {

/// @brief Placement constraint on a replica's store or locality.
struct Constraint {
    /// @brief How the constraint restricts placement.
    enum class Type : std::uint8_t {
        /// @brief Unprefixed form; prefer but do not require.
        kDeprecatedPositive = 0,

        /// @brief Replicas must be placed on matching stores ('+').
        kRequired = 1,

        /// @brief Replicas must not be placed on matching stores ('-').
        kProhibited = 2
    };

    Type type = Type::kDeprecatedPositive;

    /// @brief Locality tier key; empty for a bare store attribute.
    std::string key;

    std::string value;

    /// @brief Parse a constraint from its short string form.
    /// @return The constraint, or a kParseError describing the bad token.
    [[nodiscard]] static Result<Constraint> fromString(std::string_view shortForm);

    /// @brief Canonical short string form.
    [[nodiscard]] std::string toString() const;

    /// @brief Constraints compare equal when their canonical forms do.
    friend bool operator==(const Constraint& lhs, const Constraint& rhs) {
        return lhs.toString() == rhs.toString();
    }
};

/// @brief Parse a constraint, throwing ParseError on a malformed token.
/// @note Used by the document codecs, which report failures by exception.
[[nodiscard]] Constraint parseConstraint(std::string_view shortForm);

}  // namespace zcfg

#endif  // ZCFG_ZONE_CONSTRAINT_H
