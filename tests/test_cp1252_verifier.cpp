/**
 * @file test_cp1252_verifier.cpp
 * @brief Unit tests for the Windows-1252 decode check
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "repair/Cp1252Verifier.hpp"
#include "test_helpers.h"

using namespace yaml_repair;

TEST(Cp1252VerifierTest, UndefinedBytes) {
    for (uint8_t b : {0x81, 0x8D, 0x8F, 0x90, 0x9D}) {
        EXPECT_FALSE(Cp1252Verifier::is_decodable(b)) << std::hex << static_cast<int>(b);
    }
    for (uint8_t b : {0x00, 0x41, 0x7F, 0x80, 0x8E, 0x9F, 0xA0, 0xE9, 0xFF}) {
        EXPECT_TRUE(Cp1252Verifier::is_decodable(b)) << std::hex << static_cast<int>(b);
    }
}

TEST(Cp1252VerifierTest, VerifyBytes_AsciiPasses) {
    VerifyResult r = Cp1252Verifier::verify_bytes({'A', 'B', 'C'});
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.message.empty());
}

TEST(Cp1252VerifierTest, VerifyBytes_ReportsFirstUndecodable) {
    VerifyResult r = Cp1252Verifier::verify_bytes({'a', 0xE9, 'b', 0x81, 0x9D});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.offset, 3u);
    EXPECT_EQ(r.byte, 0x81);
    EXPECT_NE(r.message.find("0x81"), std::string::npos);
    EXPECT_NE(r.message.find("position 3"), std::string::npos);
}

TEST(Cp1252VerifierTest, VerifyBytes_OnlyChecksPrefix) {
    ByteContent bytes(1000, 'a');
    bytes.push_back(0x90);

    EXPECT_TRUE(Cp1252Verifier::verify_bytes(bytes).ok);
    EXPECT_FALSE(Cp1252Verifier::verify_bytes(bytes, 1001).ok);
}

TEST(Cp1252VerifierTest, VerifyFile) {
    test_helpers::ScratchDir dir;
    auto good = dir / "good.yml";
    auto bad = dir / "bad.yml";
    test_helpers::write_text(good, "ABC");
    test_helpers::write_bytes(bad, {'x', 0x8F});

    EXPECT_TRUE(Cp1252Verifier::verify_file(good).ok);
    VerifyResult r = Cp1252Verifier::verify_file(bad);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.offset, 1u);
}

TEST(Cp1252VerifierTest, VerifyFile_EmptyPasses) {
    test_helpers::ScratchDir dir;
    auto path = dir / "empty.yml";
    test_helpers::write_bytes(path, {});
    EXPECT_TRUE(Cp1252Verifier::verify_file(path).ok);
}

TEST(Cp1252VerifierTest, VerifyFile_MissingThrows) {
    test_helpers::ScratchDir dir;
    EXPECT_THROW(Cp1252Verifier::verify_file(dir / "missing.yml"), std::runtime_error);
}
