#include <gtest/gtest.h>
#include "bonjour_escapes.h"

using namespace bridgelink;

TEST(BonjourEscapesTest, DecodesDecimalEscapes) {
    EXPECT_EQ(bonjour_escapes::decode("Clawdis\\032Gateway"), "Clawdis Gateway");
    EXPECT_EQ(bonjour_escapes::decode("Tab\\009Here"), "Tab\tHere");
}

TEST(BonjourEscapesTest, ReassemblesMultiByteUtf8) {
    // U+2019 RIGHT SINGLE QUOTATION MARK, sent as three decimal escapes
    EXPECT_EQ(bonjour_escapes::decode("Peter\\226\\128\\153s Mac"), "Peter\xE2\x80\x99s Mac");
}

TEST(BonjourEscapesTest, DecodesLiteralEscapes) {
    EXPECT_EQ(bonjour_escapes::decode("v1\\.2"), "v1.2");
    EXPECT_EQ(bonjour_escapes::decode("back\\\\slash"), "back\\slash");
}

TEST(BonjourEscapesTest, PlainInputIsUnchanged) {
    EXPECT_EQ(bonjour_escapes::decode("Studio"), "Studio");
    EXPECT_EQ(bonjour_escapes::decode(""), "");
}

TEST(BonjourEscapesTest, MalformedEscapesDoNotReadPastTheEnd) {
    EXPECT_EQ(bonjour_escapes::decode("abc\\"), "abc\\");
    EXPECT_EQ(bonjour_escapes::decode("abc\\03"), "abc03");
    EXPECT_EQ(bonjour_escapes::decode("\\999"), "999");
}
