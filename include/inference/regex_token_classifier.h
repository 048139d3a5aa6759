#pragma once

#include "inference/token_classifier.h"

#include <nlohmann/json.hpp>

#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace shroud {
namespace inference {

/**
 * @brief Configuration for a single regex pattern
 */
struct RegexPattern {
    std::string label;          // Model-style label, e.g. TELEPHONENUM
    std::string description;
    std::string regex_str;      // Original regex string from YAML
    std::regex compiled_regex;
    std::regex::flag_type flags = std::regex::ECMAScript;
    double confidence = 0.80;
    std::string validation;     // "none" or "luhn"
    bool enabled = true;
};

/**
 * @brief Offline token classifier for structured PII
 *
 * Emits one "B-<LABEL>" token per match, with byte offsets, so it can stand
 * in for a model endpoint. Overlapping matches are resolved left to right,
 * longer match first.
 *
 * Example YAML configuration:
 * @code{.yaml}
 * patterns:
 *   - label: EMAIL
 *     regex: '[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}'
 *     flags: ["icase"]
 *     confidence: 0.95
 *     enabled: true
 * @endcode
 */
class RegexTokenClassifier : public ITokenClassifier {
public:
    RegexTokenClassifier();
    ~RegexTokenClassifier() override = default;
    
    std::string name() const override { return "regex"; }
    std::vector<redaction::RawToken> classify(const std::string& text) const override;
    
    /// Loads patterns from a config document; falls back to the embedded
    /// defaults (and returns false) when none are usable.
    bool initialize(const nlohmann::json& config);
    
    /// YAML or JSON file; embedded defaults when the file is missing or invalid
    bool loadFromFile(const std::string& path);
    
    size_t patternCount() const;
    std::string getLastError() const;
    
    static bool luhnCheck(const std::string& number);
    
private:
    void loadEmbeddedDefaults();
    bool loadPatternsFromConfig(const nlohmann::json& config);
    bool validateAndCompilePattern(RegexPattern& pattern);
    static std::regex::flag_type parseRegexFlags(const std::vector<std::string>& flag_strings);
    
    mutable std::mutex mutex_;
    std::vector<RegexPattern> patterns_;
    std::string last_error_;
    size_t max_regex_length_ = 500;
};

} // namespace inference
} // namespace shroud
