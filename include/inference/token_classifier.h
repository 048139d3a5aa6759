#pragma once

#include "redaction/pii_types.h"

#include <string>
#include <vector>

namespace shroud {
namespace inference {

/**
 * @brief Token classification collaborator
 *
 * Returns per-token label/score/surface text. Offsets are optional and the
 * caller never relies on them being present. Implementations may be slow;
 * deadlines are enforced by the caller. Failures are reported as
 * utils::InferenceError.
 *
 * Implementations must be safe to call from several threads at once.
 */
class ITokenClassifier {
public:
    virtual ~ITokenClassifier() = default;
    
    virtual std::string name() const = 0;
    
    virtual std::vector<redaction::RawToken> classify(const std::string& text) const = 0;
};

} // namespace inference
} // namespace shroud
