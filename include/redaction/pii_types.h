#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shroud {
namespace redaction {

/**
 * @brief PII type enumeration
 *
 * Closed set of entity types the proxy redacts. UNKNOWN is never produced by
 * the entity locator; it only appears when a type name cannot be parsed.
 */
enum class PiiType {
    PERSON,
    EMAIL,
    PHONE,
    ADDRESS,
    SSN,
    CREDIT_CARD,
    BANK_ACCOUNT,
    DATE_OF_BIRTH,
    PASSPORT,
    DRIVER_LICENSE,
    IP_ADDRESS,
    URL,
    USERNAME,
    PASSWORD,
    MEDICAL_ID,
    NATIONAL_ID,
    TAX_ID,
    UNKNOWN
};

/**
 * @brief A located PII span
 *
 * start/end are half-open byte offsets into the scanned text, so
 * text.substr(start, end - start) == this->text.
 */
struct PiiEntity {
    PiiType type = PiiType::UNKNOWN;
    std::string text;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;
};

/**
 * @brief One token as returned by a token classifier
 *
 * label is the raw model label ("B-EMAIL", "I-GIVENNAME", "O", ...).
 * Classifiers that know where the token sits in the input fill start/end;
 * others leave them empty and the locator recovers the position.
 */
struct RawToken {
    std::string label;
    std::string word;
    double score = 0.0;
    int index = 0;
    std::optional<size_t> start;
    std::optional<size_t> end;
};

class PiiTypeUtils {
public:
    static std::string toString(PiiType type);
    static PiiType fromString(const std::string& name);

    /// Risk points contributed by one entity of this type
    static int riskWeight(PiiType type);

    /// Maps a model tag (prefix already stripped) to a type; nullopt for "O"
    /// and anything not in the label table.
    static std::optional<PiiType> fromModelLabel(const std::string& tag);

    static const std::vector<PiiType>& allTypes();
};

} // namespace redaction
} // namespace shroud
