#include <gtest/gtest.h>

#include "fakes.hpp"
#include "redaction_burner.hpp"

using namespace pdfmask;
using namespace pdfmask::fakes;

TEST(RedactionBurner, EmptyHitsLeaveDocumentAlone) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"keep", "me"}));
    const Bytes before = doc.save();

    BurnReport r = RedactionBurner().burn(doc, {});
    EXPECT_EQ(r.marks, 0);
    EXPECT_EQ(page.apply_calls, 0);
    EXPECT_EQ(doc.save(), before);
}

TEST(RedactionBurner, RemovesTextAndLabelsWithDigest) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"the", "secret123", "code"}));
    PageHits hits{{0, {{Rect{55, 100, 95, 110}, "secret123"}}}};

    BurnReport r = RedactionBurner().burn(doc, hits);
    EXPECT_EQ(page.text(), "the code");
    ASSERT_EQ(page.fills.size(), 1u);
    EXPECT_EQ(page.fills[0], (Rect{55, 100, 95, 110}));
    ASSERT_EQ(page.labels().size(), 1u);
    EXPECT_EQ(page.labels()[0].text, "fcf730b6");
    EXPECT_EQ(page.labels()[0].font_size, 10);
    EXPECT_EQ(page.labels()[0].box, (Rect{53, 98, 97, 112}));
    EXPECT_EQ(r.labels_placed, 1);
    EXPECT_TRUE(r.incomplete.empty());
}

TEST(RedactionBurner, FallsBackToSmallerFont) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"x", "secret123"}, 100, 10, 20));
    PageHits hits{{0, {{Rect{35, 100, 55, 110}, "secret123"}}}};

    RedactionBurner().burn(doc, hits);
    ASSERT_EQ(page.labels().size(), 1u);
    EXPECT_EQ(page.labels()[0].font_size, 6);
}

TEST(RedactionBurner, LabelThatNeverFitsIsRecordedButFillStays) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"secret123"}, 100, 10, 8));
    PageHits hits{{0, {{Rect{10, 100, 18, 110}, "secret123"}}}};

    BurnReport r = RedactionBurner().burn(doc, hits);
    EXPECT_TRUE(page.labels().empty());
    EXPECT_EQ(page.fills.size(), 1u);
    EXPECT_EQ(page.text(), "");
    ASSERT_EQ(r.incomplete.size(), 1u);
    EXPECT_EQ(r.incomplete[0].literal, "secret123");
    EXPECT_EQ(r.incomplete[0].reason, "label did not fit");
}

TEST(RedactionBurner, ResidualTextIsReportedPerMark) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"alpha", "secret123"}));
    page.residual = {1};
    PageHits hits{{0, {{Rect{10, 100, 50, 110}, "alpha"}, {Rect{55, 100, 95, 110}, "secret123"}}}};

    BurnReport r = RedactionBurner().burn(doc, hits);
    ASSERT_EQ(r.incomplete.size(), 1u);
    EXPECT_EQ(r.incomplete[0].page, 0);
    EXPECT_EQ(r.incomplete[0].literal, "secret123");
    EXPECT_EQ(r.incomplete[0].reason, "text left under mark");
}

TEST(RedactionBurner, OnlyPagesWithHitsAreTouched) {
    FakeDocument doc;
    FakePage &first = doc.add_page(line_of({"secret123"}));
    FakePage &second = doc.add_page(line_of({"secret123"}));
    PageHits hits{{1, {{Rect{10, 100, 50, 110}, "secret123"}}}, {0, {}}};

    RedactionBurner().burn(doc, hits);
    EXPECT_EQ(first.apply_calls, 0);
    EXPECT_EQ(first.text(), "secret123");
    EXPECT_EQ(second.text(), "");
}

TEST(RedactionBurner, BurningTwiceChangesNothingFurther) {
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"a", "secret123", "b"}));
    PageHits hits{{0, {{Rect{55, 100, 95, 110}, "secret123"}}}};
    RedactionBurner burner;

    burner.burn(doc, hits);
    const Bytes once = doc.save();
    burner.burn(doc, hits);
    EXPECT_EQ(page.fills.size(), 1u);
    EXPECT_EQ(page.labels().size(), 1u);
    EXPECT_EQ(doc.save(), once);
}

TEST(RedactionBurner, CustomFontLadder) {
    BurnTuning t;
    t.font_sizes = {4};
    t.label_margin = 0;
    FakeDocument doc;
    FakePage &page = doc.add_page(line_of({"secret123"}));
    RedactionBurner(t).burn(doc, {{0, {{Rect{10, 100, 50, 110}, "secret123"}}}});
    ASSERT_EQ(page.labels().size(), 1u);
    EXPECT_EQ(page.labels()[0].font_size, 4);
    EXPECT_EQ(page.labels()[0].box, (Rect{10, 100, 50, 110}));
}
