#pragma once

#include "redaction/pii_types.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shroud {
namespace redaction {

/**
 * @brief Turns classifier tokens into character-accurate PII spans
 *
 * Tokens are grouped into runs of the same PII type with contiguous token
 * indices. Each run's surface text is rebuilt from its sub-word pieces and
 * then located in the original text by case-insensitive search, skipping any
 * candidate that overlaps a span already accepted for this text. When every
 * token of a run carries offsets, the offsets are used directly and the
 * search is skipped.
 *
 * The result never contains two overlapping entities, and for each entity
 * text.substr(start, end - start) == entity.text. Runs that cannot be placed
 * are dropped silently.
 */
class EntityLocator {
public:
    explicit EntityLocator(size_t min_entity_length = 2);

    std::vector<PiiEntity> locate(const std::vector<RawToken>& tokens,
                                  const std::string& text) const;

    /// Strips a B-/I- prefix and maps the tag through the label table
    static std::optional<PiiType> normalizeLabel(const std::string& label);

    /// Rebuilds a run's surface text from sub-word pieces ("##" continuation,
    /// leading " " or U+2581 word boundary). Result is trimmed.
    static std::string joinWords(const std::vector<std::string>& words);

private:
    using Span = std::pair<size_t, size_t>;

    struct Run {
        PiiType type;
        std::vector<const RawToken*> tokens;
        int last_index;
    };

    std::optional<PiiEntity> finalizeRun(const Run& run,
                                         const std::string& text,
                                         const std::string& lower_text,
                                         const std::vector<Span>& used) const;

    std::optional<Span> spanFromOffsets(const Run& run,
                                        const std::string& text,
                                        const std::vector<Span>& used) const;

    static std::optional<Span> findPosition(const std::string& search,
                                            const std::string& lower_text,
                                            const std::vector<Span>& used);

    static bool overlaps(const Span& candidate, const std::vector<Span>& used);

    size_t min_entity_length_;
};

} // namespace redaction
} // namespace shroud
