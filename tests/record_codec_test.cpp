// Record codec: partner line format in both directions

#include <gtest/gtest.h>

#include "exchange/record_codec.hpp"

using namespace ifx;

namespace {

const char* kNoPeriod = "LP";

PendingRecord pending(const std::string& inst, const std::string& op,
                      const std::string& start, const std::string& period = "P1") {
    return {inst, op, start, "2024-12-31", "KWH", period};
}

} // namespace

TEST(RecordCodecTest, EncodesDistinguishedOperandWithoutPeriod) {
    RecordCodec codec(kNoPeriod);
    std::string line;
    ASSERT_TRUE(codec.encode({"100", "LP", "2024-01-01", "2024-01-31", "KWH", ""}, line).ok());
    EXPECT_EQ(line, "100\tLP\t01.01.2024\t31.01.2024\tKWH");
}

TEST(RecordCodecTest, EncodesOtherOperandWithTrailingPeriod) {
    RecordCodec codec(kNoPeriod);
    std::string line;
    ASSERT_TRUE(codec.encode({"100", "QT", "2024-02-01", "2024-02-29", "M3", "Q1"}, line).ok());
    EXPECT_EQ(line, "100\tQT\t01.02.2024\t29.02.2024\tM3\tQ1");
}

TEST(RecordCodecTest, MissingPeriodIsValidationError) {
    RecordCodec codec(kNoPeriod);
    std::string line;
    Status s = codec.encode({"100", "QT", "2024-02-01", "2024-02-29", "M3", ""}, line);
    EXPECT_EQ(s.kind, ErrorKind::VALIDATION);
    EXPECT_NE(s.error.find("requires a period"), std::string::npos);
}

TEST(RecordCodecTest, InvalidStoreDateIsValidationError) {
    RecordCodec codec(kNoPeriod);
    std::string line;
    EXPECT_EQ(codec.encode({"1", "LP", "2023-02-29", "2023-03-01", "KWH", ""}, line).kind,
              ErrorKind::VALIDATION);
    EXPECT_EQ(codec.encode({"1", "LP", "01.01.2024", "2024-03-01", "KWH", ""}, line).kind,
              ErrorKind::VALIDATION);
}

TEST(RecordCodecTest, EncodeThenDecodeRecoversFields) {
    RecordCodec codec(kNoPeriod);
    for (const auto& original : {pending("A7", "LP", "2024-03-15", ""),
                                 pending("B2", "QT", "2020-02-29", "2020Q1")}) {
        std::string line;
        ASSERT_TRUE(codec.encode(original, line).ok());

        PendingRecord decoded;
        ASSERT_TRUE(codec.decode_outbound(line, decoded).ok()) << line;
        EXPECT_EQ(decoded.installation, original.installation);
        EXPECT_EQ(decoded.operand, original.operand);
        EXPECT_EQ(decoded.start_date, original.start_date);
        EXPECT_EQ(decoded.end_date, original.end_date);
        EXPECT_EQ(decoded.allocation_unit, original.allocation_unit);
        EXPECT_EQ(decoded.period, original.period);
        EXPECT_EQ(RecordCodec::split_tabs(line).size(), original.operand == kNoPeriod ? 5u : 6u);
    }
}

TEST(RecordCodecTest, DecodeOutboundRejectsWrongArity) {
    RecordCodec codec(kNoPeriod);
    PendingRecord rec;
    EXPECT_FALSE(codec.decode_outbound("1\tLP\t01.01.2024\t31.01.2024\tKWH\tQ1", rec).ok());
    EXPECT_FALSE(codec.decode_outbound("1\tQT\t01.01.2024\t31.01.2024\tKWH", rec).ok());
}

TEST(RecordCodecTest, ExportOrderGroupsByInstallationDistinguishedFirst) {
    RecordCodec codec(kNoPeriod);
    std::vector<PendingRecord> records = {
        pending("B", "QT", "2024-01-01"),
        pending("B", "LP", "2024-06-01", ""),
        pending("A", "QT", "2024-02-01"),
        pending("A", "QT", "2024-01-01"),
        pending("A", "LP", "2024-05-01", ""),
    };
    codec.sort_for_export(records);

    std::vector<std::string> order;
    for (const auto& r : records) order.push_back(r.installation + "/" + r.operand + "/" + r.start_date);
    EXPECT_EQ(order, (std::vector<std::string>{
        "A/LP/2024-05-01", "A/QT/2024-01-01", "A/QT/2024-02-01",
        "B/LP/2024-06-01", "B/QT/2024-01-01"}));
}

TEST(RecordCodecTest, DecodesPartnerLine) {
    ImportedRecord rec;
    Status s = RecordCodec::decode_inbound(
        "2024-01\tACC1\tINST1\tTRSG1\tBA1\t15.01.2024\t12.5", "X.txt", rec);
    ASSERT_TRUE(s.ok()) << s.error;
    EXPECT_EQ(rec.bill_period, "2024-01");
    EXPECT_EQ(rec.account, "ACC1");
    EXPECT_EQ(rec.installation, "INST1");
    EXPECT_EQ(rec.rate_group, "TRSG1");
    EXPECT_EQ(rec.agreement_id, "BA1");
    EXPECT_EQ(rec.reading_date, "2024-01-15");
    EXPECT_DOUBLE_EQ(rec.unit_value, 12.5);
    EXPECT_EQ(rec.source_file, "X.txt");
}

TEST(RecordCodecTest, ExtraInboundFieldsAreIgnored) {
    ImportedRecord rec;
    EXPECT_TRUE(RecordCodec::decode_inbound(
        "2024-01\tA\tI\tR\tB\t01.01.2024\t1\textra\tmore", "f", rec).ok());
}

TEST(RecordCodecTest, ShortInboundLineFails) {
    ImportedRecord rec;
    Status s = RecordCodec::decode_inbound("2024-01\tACC1\tINST1\tTRSG1\tBA1\t15.01.2024", "f", rec);
    EXPECT_EQ(s.kind, ErrorKind::VALIDATION);
    EXPECT_NE(s.error.find("got 6"), std::string::npos);
}

TEST(RecordCodecTest, BadReadingDateFails) {
    ImportedRecord rec;
    for (const char* date : {"2024-01-15", "15.1.2024", "32.01.2024", "29.02.2023", ""}) {
        std::string line = std::string("P\tA\tI\tR\tB\t") + date + "\t1.0";
        Status s = RecordCodec::decode_inbound(line, "f", rec);
        EXPECT_EQ(s.kind, ErrorKind::VALIDATION) << date;
        EXPECT_NE(s.error.find("DD.MM.YYYY"), std::string::npos);
    }
    EXPECT_TRUE(RecordCodec::decode_inbound("P\tA\tI\tR\tB\t29.02.2024\t1.0", "f", rec).ok());
}

TEST(RecordCodecTest, UnitValueIsDecimalPointOnly) {
    double v = 0;
    EXPECT_TRUE(RecordCodec::parse_decimal("-3.25", v));
    EXPECT_DOUBLE_EQ(v, -3.25);
    EXPECT_TRUE(RecordCodec::parse_decimal("1e3", v));
    EXPECT_DOUBLE_EQ(v, 1000.0);
    EXPECT_FALSE(RecordCodec::parse_decimal("12,5", v));
    EXPECT_FALSE(RecordCodec::parse_decimal("abc", v));
    EXPECT_FALSE(RecordCodec::parse_decimal(" 1", v));
    EXPECT_FALSE(RecordCodec::parse_decimal("", v));
    EXPECT_FALSE(RecordCodec::parse_decimal("nan", v));

    ImportedRecord rec;
    Status s = RecordCodec::decode_inbound("P\tA\tI\tR\tB\t01.01.2024\t12,5", "f", rec);
    EXPECT_EQ(s.kind, ErrorKind::VALIDATION);
}

TEST(RecordCodecTest, FileWithOneBadLineYieldsNoRecords) {
    std::string content =
        "2024-01\tA1\tI1\tR\tB\t01.01.2024\t1.5\n"
        "2024-01\tA2\tI2\tR\tB\t02.01.2024\n"
        "2024-01\tA3\tI3\tR\tB\t03.01.2024\t3.5\n";
    std::vector<ImportedRecord> records;
    Status s = RecordCodec::decode_inbound_file(content, "bad.txt", records);
    EXPECT_EQ(s.kind, ErrorKind::VALIDATION);
    EXPECT_NE(s.error.find("bad.txt line 2"), std::string::npos);
    EXPECT_TRUE(records.empty());
}

TEST(RecordCodecTest, FileAcceptsCrlfAndTrailingEmptyLines) {
    std::string content =
        "2024-01\tA1\tI1\tR\tB\t01.01.2024\t1.5\r\n"
        "2024-01\tA2\tI2\tR\tB\t02.01.2024\t2\r\n"
        "\r\n";
    std::vector<ImportedRecord> records;
    ASSERT_TRUE(RecordCodec::decode_inbound_file(content, "ok.txt", records).ok());
    ASSERT_EQ(records.size(), 2u);
    EXPECT_DOUBLE_EQ(records[1].unit_value, 2.0);
    EXPECT_EQ(records[1].source_file, "ok.txt");
}

TEST(RecordCodecTest, DecimalFormattingRoundTrips) {
    double v = 0;
    ASSERT_TRUE(RecordCodec::parse_decimal(RecordCodec::format_decimal(0.1), v));
    EXPECT_EQ(v, 0.1);
    EXPECT_EQ(RecordCodec::format_decimal(12.5), "12.5");
}
