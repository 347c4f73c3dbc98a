#include <gtest/gtest.h>

#include "report.hpp"

using namespace pdfmask;

TEST(Report, SerialisesDecisionHitsAndIncompleteRecords) {
    RunReport r;
    r.input_path = "in.pdf";
    r.output_path = "out.pdf";
    r.pages = 2;
    r.ocr.attempted = true;
    r.ocr.reason = "OCR did not improve literal hits (3 <= 3)";
    r.ocr.before.char_count = 500;
    r.ocr.before.literal_hit_count = 3;
    r.ocr.after.char_count = 560;
    r.ocr.after.literal_hit_count = 3;
    r.hits[1].push_back({Rect{1, 2, 3, 4}, "secret"});
    r.burn.labels_placed = 0;
    r.burn.incomplete.push_back({1, "secret", "label did not fit"});

    nlohmann::json j = to_json(r);
    EXPECT_EQ(j["status"], "ok");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["ocr"]["committed"], false);
    EXPECT_EQ(j["ocr"]["char_diff"], 60);
    EXPECT_EQ(j["ocr"]["before"]["literal_hit_count"], 3);
    ASSERT_EQ(j["pages"].size(), 1u);
    EXPECT_EQ(j["pages"][0]["index"], 1);
    EXPECT_EQ(j["pages"][0]["hits"][0]["rect"], nlohmann::json::array({1.0, 2.0, 3.0, 4.0}));
    EXPECT_EQ(j["incomplete"][0]["reason"], "label did not fit");
}

TEST(Report, CancelledRunWithoutOcr) {
    RunReport r;
    r.status = RunStatus::kCancelled;
    nlohmann::json j = to_json(r);
    EXPECT_EQ(j["status"], "cancelled");
    EXPECT_EQ(j["ocr"]["attempted"], false);
    EXPECT_FALSE(j["ocr"].contains("reason"));
    EXPECT_TRUE(j["pages"].empty());
}
