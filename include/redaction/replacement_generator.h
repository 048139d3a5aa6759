#pragma once

#include "redaction/pii_types.h"

#include <cstdint>
#include <string>

namespace shroud {
namespace redaction {

/**
 * @brief Deterministic fake values for detected PII
 *
 * generate() seeds a PRNG from HMAC-SHA256(salt, original) so the same
 * literal value always maps to the same fake of the same shape, across
 * calls and process restarts, as long as the salt is unchanged.
 *
 * Passwords never get a plausible fake; they become [REDACTED_PASSWORD].
 */
class ReplacementGenerator {
public:
    static std::string generate(const std::string& original, PiiType type, const std::string& salt);

    /// Non-deterministic alternative: "[TYPE]"
    static std::string simple(PiiType type);

    /// First 32 bits of the hex HMAC digest
    static uint32_t seedFor(const std::string& original, const std::string& salt);
};

} // namespace redaction
} // namespace shroud
