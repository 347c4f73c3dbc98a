#include <gtest/gtest.h>

#include "redaction_label.hpp"

using namespace pdfmask;

TEST(RedactionLabel, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(RedactionLabel, LabelIsEightHexCharsOfTheLiteralDigest) {
    EXPECT_EQ(verification_label("secret123"), "fcf730b6");
    EXPECT_EQ(verification_label("Alice Smith"), "8ae10dfc");
}
