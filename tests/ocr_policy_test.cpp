#include <stdexcept>

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "errors.hpp"
#include "fakes.hpp"
#include "ocr_policy.hpp"

using namespace pdfmask;
using namespace pdfmask::fakes;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

namespace {

EvidenceSnapshot snap(long long chars, long long hits) {
    EvidenceSnapshot s;
    s.char_count = chars;
    s.literal_hit_count = hits;
    return s;
}

const auto kForce = Field(&OcrRequest::mode, OcrMode::ForceOcr);
const auto kSkip = Field(&OcrRequest::mode, OcrMode::SkipText);

class AdaptiveOcrPolicyTest : public ::testing::Test {
protected:
    AdaptiveOcrPolicyTest()
        : original(page_bytes({"scan", "secret"})),
          // two hits and well over 80 new characters
          improved(page_bytes({"scan", "secret", "secret", std::string(100, 'x')})),
          normalised(page_bytes({"scan", "secret", "normalised"})) {}

    OcrPolicyResult run(const std::function<void()> &on_revert = {}) {
        AdaptiveOcrPolicy policy(provider, engine);
        return policy.run(original, {"secret"}, OcrProgress(), on_revert);
    }

    FakeProvider provider;
    MockOcrEngine engine;
    Bytes original;
    Bytes improved;
    Bytes normalised;
};

} // namespace

TEST(DecideOcr, EqualHitsRevert) {
    OcrDecision d = decide_ocr(snap(500, 3), snap(560, 3), OcrPolicyConfig());
    EXPECT_TRUE(d.revert);
}

TEST(DecideOcr, MoreHitsAndEnoughTextCommit) {
    OcrDecision d = decide_ocr(snap(500, 3), snap(650, 5), OcrPolicyConfig());
    EXPECT_FALSE(d.revert);
}

TEST(DecideOcr, SmallGainRevertsEvenWithMoreHits) {
    EXPECT_TRUE(decide_ocr(snap(500, 3), snap(579, 5), OcrPolicyConfig()).revert);
    EXPECT_FALSE(decide_ocr(snap(500, 3), snap(580, 5), OcrPolicyConfig()).revert);
}

TEST(DecideOcr, LostHitsRevert) {
    EXPECT_TRUE(decide_ocr(snap(500, 3), snap(900, 2), OcrPolicyConfig()).revert);
}

TEST(DecideOcr, GainThresholdIsConfigurable) {
    OcrPolicyConfig cfg;
    cfg.min_char_gain = 50;
    EXPECT_FALSE(decide_ocr(snap(500, 3), snap(560, 5), cfg).revert);
}

TEST_F(AdaptiveOcrPolicyTest, CommitsImprovedOcr) {
    EXPECT_CALL(engine, run(original, kForce, _)).WillOnce(Return(ocr_result(improved)));
    EXPECT_CALL(engine, run(_, kSkip, _)).Times(0);

    bool reverted = false;
    OcrPolicyResult r = run([&] { reverted = true; });
    EXPECT_FALSE(r.cancelled);
    EXPECT_TRUE(r.committed);
    EXPECT_EQ(r.state, OcrPolicyState::Committed);
    EXPECT_EQ(r.document, improved);
    EXPECT_EQ(r.before.literal_hit_count, 1);
    EXPECT_EQ(r.after.literal_hit_count, 2);
    EXPECT_FALSE(reverted);
}

TEST_F(AdaptiveOcrPolicyTest, RevertsToSkipTextWhenNothingImproved) {
    EXPECT_CALL(engine, run(original, kForce, _)).WillOnce(Return(ocr_result(original)));
    EXPECT_CALL(engine, run(original, kSkip, _)).WillOnce(Return(ocr_result(normalised)));

    bool reverted = false;
    OcrPolicyResult r = run([&] { reverted = true; });
    EXPECT_TRUE(reverted);
    EXPECT_EQ(r.after.literal_hit_count, r.before.literal_hit_count);
    EXPECT_FALSE(r.committed);
    EXPECT_FALSE(r.fallback_used);
    EXPECT_EQ(r.state, OcrPolicyState::Candidate);
    EXPECT_EQ(r.document, normalised);
}

TEST_F(AdaptiveOcrPolicyTest, ForceFailureKeepsOriginalWithoutSecondPass) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Throw(EngineError("tesseract crashed")));
    EXPECT_CALL(engine, run(_, kSkip, _)).Times(0);

    OcrPolicyResult r = run();
    EXPECT_FALSE(r.committed);
    EXPECT_TRUE(r.fallback_used);
    EXPECT_EQ(r.document, original);
}

TEST_F(AdaptiveOcrPolicyTest, OpenCvErrorKeepsOriginal) {
    EXPECT_CALL(engine, run(_, kForce, _))
        .WillOnce(Throw(cv::Exception(cv::Error::StsError, "imwrite failed", "run", __FILE__, __LINE__)));
    EXPECT_CALL(engine, run(_, kSkip, _)).Times(0);

    OcrPolicyResult r = run();
    EXPECT_FALSE(r.cancelled);
    EXPECT_TRUE(r.fallback_used);
    EXPECT_EQ(r.document, original);
}

TEST_F(AdaptiveOcrPolicyTest, LogicErrorDuringSkipTextFallsBackToOriginal) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Return(ocr_result(original)));
    EXPECT_CALL(engine, run(_, kSkip, _)).WillOnce(Throw(std::out_of_range("page index")));

    OcrPolicyResult r = run();
    EXPECT_TRUE(r.fallback_used);
    EXPECT_EQ(r.document, original);
}

TEST_F(AdaptiveOcrPolicyTest, UnreadableOcrOutputKeepsOriginal) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Return(ocr_result(Bytes{'%', 'P'})));
    OcrPolicyResult r = run();
    EXPECT_TRUE(r.fallback_used);
    EXPECT_EQ(r.document, original);
}

TEST_F(AdaptiveOcrPolicyTest, SkipTextFailureFallsBackToOriginal) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Return(ocr_result(original)));
    EXPECT_CALL(engine, run(_, kSkip, _)).WillOnce(Throw(EngineError("disk full")));

    OcrPolicyResult r = run();
    EXPECT_FALSE(r.cancelled);
    EXPECT_TRUE(r.fallback_used);
    EXPECT_EQ(r.document, original);
}

TEST_F(AdaptiveOcrPolicyTest, CancelledForcePassStops) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Return(ocr_cancelled()));
    EXPECT_CALL(engine, run(_, kSkip, _)).Times(0);
    EXPECT_TRUE(run().cancelled);
}

TEST_F(AdaptiveOcrPolicyTest, CancelledSkipPassStops) {
    EXPECT_CALL(engine, run(_, kForce, _)).WillOnce(Return(ocr_result(original)));
    EXPECT_CALL(engine, run(_, kSkip, _)).WillOnce(Return(ocr_cancelled()));
    EXPECT_TRUE(run().cancelled);
}

TEST_F(AdaptiveOcrPolicyTest, LanguageIsPassedToTheEngine) {
    OcrPolicyConfig cfg;
    cfg.language = "deu";
    EXPECT_CALL(engine, run(_, Field(&OcrRequest::language, "deu"), _)).WillOnce(Return(ocr_result(improved)));
    AdaptiveOcrPolicy policy(provider, engine, cfg);
    EXPECT_TRUE(policy.run(original, {"secret"}, OcrProgress()).committed);
}
