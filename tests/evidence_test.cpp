#include <gtest/gtest.h>

#include "evidence.hpp"
#include "fakes.hpp"

using namespace pdfmask;
using namespace pdfmask::fakes;

TEST(Evidence, CharCountSumsPagesInCodePoints) {
    FakeDocument doc;
    doc.add_page(line_of({"h\xC3\xA9llo"}));
    doc.add_page(line_of({"ab", "cd"}));
    EXPECT_EQ(count_chars(doc), 5 + 5);
}

TEST(Evidence, LiteralHitsAreCaseSensitiveAndSummed) {
    FakeDocument doc;
    doc.add_page(line_of({"Secret", "secret", "secret"}));
    doc.add_page(line_of({"secret", "Bob"}));
    EXPECT_EQ(count_literal_hits(doc, {"secret", "Bob", "bob"}), 3 + 1);
}

TEST(Evidence, SnapshotMatchesSeparateMeasurements) {
    FakeDocument doc;
    doc.add_page(line_of({"alpha", "beta", "alpha"}));
    EvidenceSnapshot s = measure_evidence(doc, {"alpha"});
    EXPECT_EQ(s.char_count, count_chars(doc));
    EXPECT_EQ(s.literal_hit_count, 2);
}

TEST(Evidence, MeasuresSerialisedDocumentThroughProvider) {
    FakeProvider provider;
    EvidenceSnapshot s = measure_evidence(provider, page_bytes({"one", "two"}), {"two"});
    EXPECT_EQ(s.char_count, 7);
    EXPECT_EQ(s.literal_hit_count, 1);
    EXPECT_THROW(measure_evidence(provider, Bytes{'x'}, {"two"}), IoError);
}
