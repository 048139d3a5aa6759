#include "inference/regex_token_classifier.h"
#include "utils/config.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>

namespace shroud {
namespace inference {

namespace {

struct Match {
    size_t start;
    size_t end;
    const RegexPattern* pattern;
};

} // namespace

RegexTokenClassifier::RegexTokenClassifier() {
    loadEmbeddedDefaults();
}

std::vector<redaction::RawToken> RegexTokenClassifier::classify(const std::string& text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<Match> matches;
    for (const auto& pattern : patterns_) {
        if (!pattern.enabled) continue;
        
        std::sregex_iterator it(text.begin(), text.end(), pattern.compiled_regex);
        std::sregex_iterator end;
        for (; it != end; ++it) {
            const std::smatch& match = *it;
            if (match.length() == 0) continue;
            if (pattern.validation == "luhn" && !luhnCheck(match.str())) {
                continue;
            }
            size_t start = static_cast<size_t>(match.position());
            matches.push_back({start, start + static_cast<size_t>(match.length()), &pattern});
        }
    }
    
    std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.start != b.start) return a.start < b.start;
        return (a.end - a.start) > (b.end - b.start);
    });
    
    std::vector<redaction::RawToken> tokens;
    size_t covered_until = 0;
    int index = 0;
    for (const auto& m : matches) {
        if (!tokens.empty() && m.start < covered_until) continue;
        
        redaction::RawToken token;
        token.label = "B-" + m.pattern->label;
        token.word = text.substr(m.start, m.end - m.start);
        token.score = m.pattern->confidence;
        // Leave an index gap so adjacent matches never merge into one run
        token.index = index;
        index += 2;
        token.start = m.start;
        token.end = m.end;
        tokens.push_back(std::move(token));
        covered_until = m.end;
    }
    return tokens;
}

bool RegexTokenClassifier::initialize(const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_.clear();
    
    if (config.contains("settings")) {
        max_regex_length_ = config["settings"].value("max_regex_length", static_cast<size_t>(500));
    }
    
    if (!loadPatternsFromConfig(config)) {
        SHROUD_WARN("RegexTokenClassifier: Pattern loading failed ({}), using embedded defaults", last_error_);
        loadEmbeddedDefaults();
        return false;
    }
    SHROUD_INFO("RegexTokenClassifier: Initialized with {} patterns", patterns_.size());
    return true;
}

bool RegexTokenClassifier::loadFromFile(const std::string& path) {
    auto config = utils::loadConfigFile(path);
    if (!config) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = "Cannot read pattern file " + path;
        SHROUD_WARN("RegexTokenClassifier: {}, using embedded defaults", last_error_);
        loadEmbeddedDefaults();
        return false;
    }
    return initialize(*config);
}

size_t RegexTokenClassifier::patternCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return patterns_.size();
}

std::string RegexTokenClassifier::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void RegexTokenClassifier::loadEmbeddedDefaults() {
    patterns_.clear();
    
    auto add = [this](const char* label, const char* description, const char* regex,
                      std::regex::flag_type flags, double confidence, const char* validation) {
        RegexPattern p;
        p.label = label;
        p.description = description;
        p.regex_str = regex;
        p.flags = flags;
        p.confidence = confidence;
        p.validation = validation;
        if (validateAndCompilePattern(p)) {
            patterns_.push_back(std::move(p));
        }
    };
    
    add("EMAIL", "Email address",
        R"([a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,})",
        std::regex::ECMAScript | std::regex::icase, 0.95, "none");
    add("SOCIALNUM", "US Social Security Number",
        R"(\b\d{3}-\d{2}-\d{4}\b)",
        std::regex::ECMAScript, 0.98, "none");
    add("CREDITCARDNUMBER", "Credit card number",
        R"(\b[3456]\d{3}(?:[ \-]?\d{4}){3}\b)",
        std::regex::ECMAScript, 0.90, "luhn");
    add("TELEPHONENUM", "Phone number",
        R"((?:\+\d{1,3}[\s.\-]?)?\(?\b\d{3}\)?[\s.\-]?\d{3}[\s.\-]\d{4}\b)",
        std::regex::ECMAScript, 0.85, "none");
    add("IP_ADDRESS", "IPv4 address",
        R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)",
        std::regex::ECMAScript, 0.80, "none");
    add("URL", "HTTP/HTTPS URL",
        R"(https?://[^\s"'<>]+)",
        std::regex::ECMAScript | std::regex::icase, 0.90, "none");
    
    SHROUD_DEBUG("RegexTokenClassifier: Loaded {} embedded default patterns", patterns_.size());
}

bool RegexTokenClassifier::loadPatternsFromConfig(const nlohmann::json& config) {
    if (!config.contains("patterns") || !config["patterns"].is_array()) {
        last_error_ = "No 'patterns' section found in configuration";
        return false;
    }
    
    std::vector<RegexPattern> loaded;
    for (const auto& node : config["patterns"]) {
        RegexPattern pattern;
        try {
            pattern.label = node.value("label", node.value("name", std::string()));
            pattern.description = node.value("description", std::string());
            pattern.regex_str = node.value("regex", std::string());
            pattern.confidence = node.value("confidence", 0.80);
            pattern.validation = node.value("validation", std::string("none"));
            pattern.enabled = node.value("enabled", true);
            
            std::vector<std::string> flag_strings;
            if (node.contains("flags") && node["flags"].is_array()) {
                for (const auto& flag : node["flags"]) {
                    flag_strings.push_back(flag.get<std::string>());
                }
            }
            pattern.flags = parseRegexFlags(flag_strings);
        } catch (const nlohmann::json::exception& e) {
            SHROUD_WARN("RegexTokenClassifier: Failed to parse pattern: {}", e.what());
            continue;
        }
        
        if (pattern.label.empty() || pattern.regex_str.empty()) {
            SHROUD_WARN("RegexTokenClassifier: Skipping pattern without label or regex");
            continue;
        }
        if (!redaction::PiiTypeUtils::fromModelLabel(pattern.label)) {
            SHROUD_WARN("RegexTokenClassifier: Label '{}' maps to no PII type", pattern.label);
            continue;
        }
        if (pattern.regex_str.length() > max_regex_length_) {
            SHROUD_WARN("RegexTokenClassifier: Pattern '{}' exceeds max regex length", pattern.label);
            continue;
        }
        if (!validateAndCompilePattern(pattern)) {
            continue;
        }
        loaded.push_back(std::move(pattern));
    }
    
    if (loaded.empty()) {
        last_error_ = "No valid patterns loaded from configuration";
        return false;
    }
    patterns_ = std::move(loaded);
    return true;
}

bool RegexTokenClassifier::validateAndCompilePattern(RegexPattern& pattern) {
    try {
        pattern.compiled_regex = std::regex(pattern.regex_str, pattern.flags);
        return true;
    } catch (const std::regex_error& e) {
        SHROUD_ERROR("RegexTokenClassifier: Regex compilation failed for '{}': {}",
                     pattern.label, e.what());
        return false;
    }
}

std::regex::flag_type RegexTokenClassifier::parseRegexFlags(const std::vector<std::string>& flag_strings) {
    std::regex::flag_type flags = std::regex::ECMAScript;
    for (const auto& flag : flag_strings) {
        if (flag == "icase") {
            flags |= std::regex::icase;
        } else if (flag == "optimize") {
            flags |= std::regex::optimize;
        }
    }
    return flags;
}

bool RegexTokenClassifier::luhnCheck(const std::string& number) {
    std::string digits;
    for (char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.length() < 13 || digits.length() > 19) {
        return false;
    }
    
    int sum = 0;
    bool alternate = false;
    for (int i = static_cast<int>(digits.length()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';
        if (alternate) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        alternate = !alternate;
    }
    return (sum % 10) == 0;
}

} // namespace inference
} // namespace shroud
