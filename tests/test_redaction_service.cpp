#include <gtest/gtest.h>
#include "redaction/redaction_service.h"
#include "redaction/replacement_generator.h"
#include "utils/errors.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace shroud;
using namespace shroud::redaction;

namespace {

RawToken tok(const std::string& label, const std::string& word, double score, int index) {
    RawToken t;
    t.label = label;
    t.word = word;
    t.score = score;
    t.index = index;
    return t;
}

class FakeClassifier : public inference::ITokenClassifier {
public:
    explicit FakeClassifier(std::vector<RawToken> tokens,
                            std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : tokens_(std::move(tokens)), delay_(delay) {}

    std::string name() const override { return "fake"; }

    std::vector<RawToken> classify(const std::string&) const override {
        calls_++;
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (fail_) {
            throw utils::InferenceError("classifier unavailable");
        }
        return tokens_;
    }

    void setFailing(bool fail) { fail_ = fail; }
    int calls() const { return calls_.load(); }

private:
    std::vector<RawToken> tokens_;
    std::chrono::milliseconds delay_;
    std::atomic<bool> fail_{false};
    mutable std::atomic<int> calls_{0};
};

} // namespace

class RedactionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.salt = "test-salt";
        options_.timeout_ms = 1000;
    }

    RedactionOptions options_;
};

TEST_F(RedactionServiceTest, RedactsEmailDeterministically) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{
        tok("B-EMAIL", " test@example.com", 0.95, 0)
    });
    RedactionService service(classifier, options_);

    const std::string text = "My email is test@example.com";
    auto result = service.redact(text);

    ASSERT_EQ(result.entities.size(), 1u);
    EXPECT_EQ(result.entities[0].start, 12u);
    EXPECT_EQ(result.entities[0].end, 28u);

    std::string fake = ReplacementGenerator::generate("test@example.com", PiiType::EMAIL, "test-salt");
    EXPECT_EQ(result.text, "My email is " + fake);
    EXPECT_EQ(service.redact(text).text, result.text);
}

TEST_F(RedactionServiceTest, AppliesReplacementsRightToLeft) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{
        tok("B-GIVENNAME", "Alice", 0.9, 0),
        tok("O", "called", 0.9, 1),
        tok("B-TELEPHONENUM", "555-0100", 0.9, 2)
    });
    options_.use_deterministic_replacement = false;
    RedactionService service(classifier, options_);

    auto result = service.redact("Alice called 555-0100 today");
    EXPECT_EQ(result.text, "[PERSON] called [PHONE] today");
    EXPECT_EQ(result.entities.size(), 2u);
}

TEST_F(RedactionServiceTest, ApplyRedactionsIgnoresInputOrder) {
    std::vector<PiiEntity> entities(2);
    entities[0] = {PiiType::EMAIL, "a@b.io", 0, 6, 0.9};
    entities[1] = {PiiType::PHONE, "555-0100", 11, 19, 0.9};

    RedactionOptions opts;
    opts.use_deterministic_replacement = false;
    std::vector<PiiEntity> reversed = {entities[1], entities[0]};

    EXPECT_EQ(RedactionService::applyRedactions("a@b.io and 555-0100", entities, opts),
              "[EMAIL] and [PHONE]");
    EXPECT_EQ(RedactionService::applyRedactions("a@b.io and 555-0100", reversed, opts),
              "[EMAIL] and [PHONE]");
}

TEST_F(RedactionServiceTest, NoEntitiesReturnsInputUnchanged) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{
        tok("O", "hello", 0.99, 0)
    });
    RedactionService service(classifier, options_);

    auto result = service.redact("hello world");
    EXPECT_EQ(result.text, "hello world");
    EXPECT_TRUE(result.entities.empty());
}

TEST_F(RedactionServiceTest, BlankInputSkipsClassifier) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{});
    RedactionService service(classifier, options_);

    auto result = service.redact("   ");
    EXPECT_EQ(result.text, "   ");
    EXPECT_TRUE(result.entities.empty());
    EXPECT_EQ(result.processing_time_ms, 0);
    EXPECT_EQ(classifier->calls(), 0);
}

TEST_F(RedactionServiceTest, TimeoutFailClosedThrows) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{},
                                                       std::chrono::milliseconds(300));
    options_.timeout_ms = 50;
    options_.fail_strategy = FailStrategy::CLOSED;
    RedactionService service(classifier, options_);

    EXPECT_THROW(service.redact("My SSN is 123-45-6789"), utils::InferenceTimeoutError);
}

TEST_F(RedactionServiceTest, TimeoutFailOpenPassesTextThrough) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{
        tok("B-SOCIALNUM", "123-45-6789", 0.99, 0)
    }, std::chrono::milliseconds(300));
    options_.timeout_ms = 50;
    options_.fail_strategy = FailStrategy::OPEN;
    RedactionService service(classifier, options_);

    auto result = service.redact("My SSN is 123-45-6789");
    EXPECT_EQ(result.text, "My SSN is 123-45-6789");
    EXPECT_TRUE(result.entities.empty());
    EXPECT_EQ(result.processing_time_ms, 50);
}

TEST_F(RedactionServiceTest, ClassifierErrorPropagatesEvenWhenFailOpen) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{});
    classifier->setFailing(true);
    options_.fail_strategy = FailStrategy::OPEN;
    RedactionService service(classifier, options_);

    EXPECT_THROW(service.redact("anything"), utils::InferenceError);
}

TEST_F(RedactionServiceTest, DetectReturnsTokensAndIgnoresFailOpen) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{
        tok("B-EMAIL", "x@y.io", 0.9, 0)
    });
    RedactionService service(classifier, options_);

    auto detection = service.detect("mail x@y.io");
    EXPECT_EQ(detection.tokens.size(), 1u);
    ASSERT_EQ(detection.entities.size(), 1u);
    EXPECT_EQ(detection.entities[0].start, 5u);

    auto slow = std::make_shared<FakeClassifier>(std::vector<RawToken>{},
                                                 std::chrono::milliseconds(300));
    options_.timeout_ms = 50;
    options_.fail_strategy = FailStrategy::OPEN;
    RedactionService slow_service(slow, options_);
    EXPECT_THROW(slow_service.detect("mail x@y.io"), utils::InferenceTimeoutError);
}

TEST_F(RedactionServiceTest, UpdateOptionsMergesFields) {
    auto classifier = std::make_shared<FakeClassifier>(std::vector<RawToken>{});
    RedactionService service(classifier, options_);

    RedactionOptionsUpdate update;
    update.fail_strategy = FailStrategy::OPEN;
    update.timeout_ms = 250;
    service.updateOptions(update);

    auto opts = service.getOptions();
    EXPECT_EQ(opts.fail_strategy, FailStrategy::OPEN);
    EXPECT_EQ(opts.timeout_ms, 250);
    EXPECT_EQ(opts.salt, "test-salt");
    EXPECT_TRUE(opts.use_deterministic_replacement);
}

TEST_F(RedactionServiceTest, FailStrategyParsing) {
    EXPECT_EQ(failStrategyFromString("open"), FailStrategy::OPEN);
    EXPECT_EQ(failStrategyFromString(" CLOSED "), FailStrategy::CLOSED);
    EXPECT_EQ(failStrategyToString(FailStrategy::OPEN), "open");
    EXPECT_THROW(failStrategyFromString("maybe"), std::invalid_argument);
}

TEST_F(RedactionServiceTest, RequiresClassifier) {
    EXPECT_THROW(RedactionService(nullptr, options_), std::invalid_argument);
}
