#include <string>

#include <gtest/gtest.h>

#include "protocol.hpp"

TEST(Protocol, EncodedMessageIsOneTerminatedLine) {
    dasim::NaiveTransfer t;
    t.filename = "odd\nname.bin";
    t.data = {0, 10, 13, 255};
    t.checksum = "ab";
    const std::string line = dasim::encode_line(t);
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    EXPECT_NE(line.find("\"data\":[0,10,13,255]"), std::string::npos);
}

TEST(Protocol, DecodesExternallyTaggedVariants) {
    dasim::Message m;
    std::string err;

    ASSERT_TRUE(dasim::decode_message(R"({"Handshake":{"pubkey":[1,2],"sig":[3],"ts":1000}})", m, &err)) << err;
    const auto* hs = std::get_if<dasim::Handshake>(&m);
    ASSERT_NE(hs, nullptr);
    EXPECT_EQ(hs->pubkey, (dasim::Bytes{1, 2}));
    EXPECT_EQ(hs->sig, (dasim::Bytes{3}));
    EXPECT_EQ(hs->ts, 1000u);

    ASSERT_TRUE(dasim::decode_message(
        R"({"NaiveTransfer":{"filename":"a.txt","data":[104,105],"checksum":"cafe"}})", m, &err)) << err;
    const auto* t = std::get_if<dasim::NaiveTransfer>(&m);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->filename, "a.txt");
    EXPECT_EQ(t->data, (dasim::Bytes{104, 105}));
    EXPECT_EQ(t->checksum, "cafe");

    ASSERT_TRUE(dasim::decode_message(
        R"({"DasShard":{"filename":"b","original_len":7,"index":5,"data":[],"full_file_checksum":"00"}})" "\n",
        m, &err)) << err;
    const auto* s = std::get_if<dasim::DasShard>(&m);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->filename, "b");
    EXPECT_EQ(s->original_len, 7u);
    EXPECT_EQ(s->index, 5u);
    EXPECT_TRUE(s->data.empty());
    EXPECT_EQ(s->full_file_checksum, "00");
    EXPECT_STREQ(dasim::message_kind(m), "DasShard");
}

TEST(Protocol, EncodeThenDecodeKeepsShardFields) {
    dasim::DasShard in;
    in.filename = "blob.bin";
    in.original_len = 123456;
    in.index = 4;
    in.data = {9, 8, 7, 0, 255};
    in.full_file_checksum = std::string(64, 'f');

    dasim::Message out;
    std::string err;
    ASSERT_TRUE(dasim::decode_message(dasim::encode_line(in), out, &err)) << err;
    const auto* s = std::get_if<dasim::DasShard>(&out);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->filename, in.filename);
    EXPECT_EQ(s->original_len, in.original_len);
    EXPECT_EQ(s->index, in.index);
    EXPECT_EQ(s->data, in.data);
    EXPECT_EQ(s->full_file_checksum, in.full_file_checksum);
}

TEST(Protocol, IgnoresUnknownFields) {
    dasim::Message m;
    std::string err;
    EXPECT_TRUE(dasim::decode_message(
        R"({"Handshake":{"pubkey":[],"sig":[],"ts":1,"extra":"x"}})", m, &err)) << err;
}

TEST(Protocol, RejectsMalformedLines) {
    const char* bad[] = {
        "not json",
        R"({"Handshake":{"pubkey":[1],"sig":[2]}})",
        R"({"Handshake":{"pubkey":[256],"sig":[],"ts":1}})",
        R"({"Handshake":{"pubkey":[-1],"sig":[],"ts":1}})",
        R"({"Handshake":{"pubkey":"abc","sig":[],"ts":1}})",
        R"({"DasShard":{"filename":"b","original_len":7,"index":-1,"data":[],"full_file_checksum":"00"}})",
        R"({"DasShard":{"filename":3,"original_len":7,"index":1,"data":[],"full_file_checksum":"00"}})",
        R"({"Bogus":{}})",
        R"({"Handshake":{"pubkey":[],"sig":[],"ts":1},"NaiveTransfer":{}})",
        R"({"NaiveTransfer":[1,2]})",
        R"([1,2,3])",
    };
    for (const char* line : bad) {
        dasim::Message m;
        std::string err;
        EXPECT_FALSE(dasim::decode_message(line, m, &err)) << line;
        EXPECT_FALSE(err.empty()) << line;
    }
}

TEST(Protocol, BlankLineDetection) {
    EXPECT_TRUE(dasim::is_blank_line(""));
    EXPECT_TRUE(dasim::is_blank_line("  \t\r"));
    EXPECT_FALSE(dasim::is_blank_line(" {}"));
}
