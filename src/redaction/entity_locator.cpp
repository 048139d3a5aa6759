#include "redaction/entity_locator.h"
#include "utils/text_utils.h"

#include <algorithm>
#include <cctype>
#include <numeric>

namespace shroud {
namespace redaction {

namespace {

// SentencePiece word-boundary marker U+2581
const std::string kSentencePieceSpace = "\xE2\x96\x81";

} // namespace

EntityLocator::EntityLocator(size_t min_entity_length)
    : min_entity_length_(min_entity_length) {
}

std::optional<PiiType> EntityLocator::normalizeLabel(const std::string& label) {
    if (label.empty() || label == "O") {
        return std::nullopt;
    }
    std::string tag = label;
    if (utils::startsWith(tag, "B-") || utils::startsWith(tag, "I-")) {
        tag = tag.substr(2);
    }
    return PiiTypeUtils::fromModelLabel(tag);
}

std::string EntityLocator::joinWords(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& w : words) {
        if (utils::startsWith(w, "##")) {
            joined += w.substr(2);
        } else if (utils::startsWith(w, " ")) {
            joined += joined.empty() ? w.substr(1) : w;
        } else if (utils::startsWith(w, kSentencePieceSpace)) {
            std::string rest = w.substr(kSentencePieceSpace.size());
            joined += joined.empty() ? rest : " " + rest;
        } else {
            joined += w;
        }
    }
    return utils::trim(joined);
}

std::vector<PiiEntity> EntityLocator::locate(const std::vector<RawToken>& tokens,
                                             const std::string& text) const {
    std::vector<PiiEntity> entities;
    std::vector<Span> used;
    const std::string lower_text = utils::asciiLower(text);

    std::optional<Run> run;

    auto closeRun = [&]() {
        if (!run) return;
        auto entity = finalizeRun(*run, text, lower_text, used);
        if (entity) {
            used.emplace_back(entity->start, entity->end);
            entities.push_back(std::move(*entity));
        }
        run.reset();
    };

    for (const auto& token : tokens) {
        auto type = normalizeLabel(token.label);
        if (!type) {
            closeRun();
            continue;
        }

        // A skipped index means an unlabeled token sat between the two
        bool has_gap = run && token.index > run->last_index + 1;

        if (!run || run->type != *type || has_gap) {
            closeRun();
            run = Run{*type, {&token}, token.index};
        } else {
            run->tokens.push_back(&token);
            run->last_index = token.index;
        }
    }
    closeRun();

    return entities;
}

std::optional<PiiEntity> EntityLocator::finalizeRun(const Run& run,
                                                    const std::string& text,
                                                    const std::string& lower_text,
                                                    const std::vector<Span>& used) const {
    auto span = spanFromOffsets(run, text, used);

    // Offsets missing, invalid or colliding with an accepted span: place the
    // run by text search instead, which may pick a different occurrence
    if (!span) {
        std::vector<std::string> words;
        words.reserve(run.tokens.size());
        for (const auto* t : run.tokens) {
            words.push_back(t->word);
        }
        std::string joined = joinWords(words);
        if (utils::utf8Length(joined) < min_entity_length_) {
            return std::nullopt;
        }
        span = findPosition(joined, lower_text, used);
        if (!span) {
            return std::nullopt;
        }
    }

    double score_sum = std::accumulate(run.tokens.begin(), run.tokens.end(), 0.0,
        [](double acc, const RawToken* t) { return acc + t->score; });

    PiiEntity entity;
    entity.type = run.type;
    entity.start = span->first;
    entity.end = span->second;
    entity.text = text.substr(span->first, span->second - span->first);
    entity.confidence = score_sum / static_cast<double>(run.tokens.size());
    return entity;
}

std::optional<EntityLocator::Span> EntityLocator::spanFromOffsets(const Run& run,
                                                                  const std::string& text,
                                                                  const std::vector<Span>& used) const {
    size_t start = text.size();
    size_t end = 0;
    for (const auto* t : run.tokens) {
        if (!t->start || !t->end) {
            return std::nullopt;
        }
        start = std::min(start, *t->start);
        end = std::max(end, *t->end);
    }
    if (end > text.size() || start >= end) {
        return std::nullopt;
    }

    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    Span span{start, end};
    if (utils::utf8Length(text.substr(start, end - start)) < min_entity_length_ ||
        overlaps(span, used)) {
        return std::nullopt;
    }
    return span;
}

std::optional<EntityLocator::Span> EntityLocator::findPosition(const std::string& search,
                                                               const std::string& lower_text,
                                                               const std::vector<Span>& used) {
    const std::string target = utils::asciiLower(search);

    size_t from = 0;
    while (from < lower_text.size()) {
        size_t start = lower_text.find(target, from);
        if (start == std::string::npos) break;

        Span candidate{start, start + target.size()};
        if (!overlaps(candidate, used)) {
            return candidate;
        }
        from = start + 1;
    }
    return std::nullopt;
}

bool EntityLocator::overlaps(const Span& candidate, const std::vector<Span>& used) {
    for (const auto& [s, e] : used) {
        if (candidate.first < e && candidate.second > s) {
            return true;
        }
    }
    return false;
}

} // namespace redaction
} // namespace shroud
