// Configuration loading and validation

#include <gtest/gtest.h>

#include "config.hpp"
#include "fakes.hpp"

using namespace ifx;
using ifx::test::TempDir;
using ifx::test::write_file;

namespace {

const char* kFullConfig = R"({
  "database": {"host": "db", "port": 6432, "user": "ifx", "password": "pw",
               "database": "billing", "connect_timeout_s": 3},
  "ftp": {"host": "ftp.partner", "port": 2121, "user": "u", "password": "p",
          "remote_root": "/x", "passive": false, "timeout_s": 30},
  "retry": {"max_attempts": 5, "wait_s": 0.25},
  "outbound": {"table": "billing.outbound", "remote_dir": "/upload",
               "staging_dir": "/tmp/o", "archive_dir": "/tmp/oa",
               "file_prefix": "ALLOC", "no_period_operand": "ZZ"},
  "inbound": {"table": "billing.readings", "remote_dir": "/download",
              "completed_subdir": "done", "file_pattern": "READ_*.txt",
              "ledger_table": "billing.import_ledger"},
  "report_dir": "/tmp/r",
  "log_level": "debug"
})";

} // namespace

TEST(ConfigTest, LoadsAllSections) {
    TempDir tmp;
    write_file(tmp.path() / "c.json", kFullConfig);

    ExchangeConfig cfg;
    Status s = ExchangeConfig::from_json(tmp.sub("c.json"), cfg);
    ASSERT_TRUE(s.ok()) << s.error;

    EXPECT_EQ(cfg.database.host, "db");
    EXPECT_EQ(cfg.database.port, 6432);
    EXPECT_EQ(cfg.database.database, "billing");
    EXPECT_EQ(cfg.ftp.host, "ftp.partner");
    EXPECT_EQ(cfg.ftp.port, 2121);
    EXPECT_FALSE(cfg.ftp.passive);
    EXPECT_EQ(cfg.retry.max_attempts, 5);
    EXPECT_EQ(cfg.retry.wait.count(), 250);
    EXPECT_EQ(cfg.outbound.table, "billing.outbound");
    EXPECT_EQ(cfg.outbound.file_prefix, "ALLOC");
    EXPECT_EQ(cfg.outbound.no_period_operand, "ZZ");
    EXPECT_EQ(cfg.inbound.completed_subdir, "done");
    EXPECT_EQ(cfg.inbound.file_pattern, "READ_*.txt");
    EXPECT_EQ(cfg.inbound.ledger_table, "billing.import_ledger");
    EXPECT_EQ(cfg.report_dir, "/tmp/r");
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigTest, OmittedKeysKeepDefaults) {
    TempDir tmp;
    write_file(tmp.path() / "c.json", R"({"ftp": {"host": "h"}})");

    ExchangeConfig cfg;
    ASSERT_TRUE(ExchangeConfig::from_json(tmp.sub("c.json"), cfg).ok());
    EXPECT_EQ(cfg.database.port, 5432);
    EXPECT_EQ(cfg.retry.max_attempts, 3);
    EXPECT_EQ(cfg.retry.wait.count(), 5000);
    EXPECT_EQ(cfg.outbound.no_period_operand, "LP");
    EXPECT_EQ(cfg.inbound.marker_ext, "ok");
    EXPECT_TRUE(cfg.log_file.empty());
}

TEST(ConfigTest, MissingFileIsConfigurationError) {
    ExchangeConfig cfg;
    Status s = ExchangeConfig::from_json("/nonexistent/ifx.json", cfg);
    EXPECT_EQ(s.kind, ErrorKind::CONFIGURATION);
}

TEST(ConfigTest, MalformedJsonIsConfigurationError) {
    TempDir tmp;
    write_file(tmp.path() / "c.json", "{\"ftp\": {\"host\": ");
    ExchangeConfig cfg;
    EXPECT_EQ(ExchangeConfig::from_json(tmp.sub("c.json"), cfg).kind, ErrorKind::CONFIGURATION);

    write_file(tmp.path() / "c.json", R"({"ftp": {"host": "h", "port": "twenty-one"}})");
    EXPECT_EQ(ExchangeConfig::from_json(tmp.sub("c.json"), cfg).kind, ErrorKind::CONFIGURATION);
}

TEST(ConfigTest, ValidationRejectsUnsafeOrMissingValues) {
    ExchangeConfig cfg;
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);  // no ftp.host

    cfg.ftp.host = "h";
    EXPECT_TRUE(cfg.validate().ok());

    cfg.outbound.table = "outbound; DROP TABLE x";
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);
    cfg.outbound.table = "exchange_outbound";

    cfg.retry.max_attempts = 0;
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);
    cfg.retry.max_attempts = 1;

    cfg.inbound.completed_subdir = "a/b";
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);
    cfg.inbound.completed_subdir = "completed";

    cfg.inbound.ledger_table = "ledger-x";
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);
    cfg.inbound.ledger_table = "exchange_import_ledger";

    cfg.outbound.sequence_suffix = "A1";
    EXPECT_EQ(cfg.validate().kind, ErrorKind::CONFIGURATION);
    cfg.outbound.sequence_suffix = "0001";
    EXPECT_TRUE(cfg.validate().ok());
}

TEST(ConfigTest, RunModeNames) {
    RunMode m = RunMode::BOTH;
    EXPECT_TRUE(parse_run_mode("inbound", m));
    EXPECT_EQ(m, RunMode::INBOUND);
    EXPECT_FALSE(parse_run_mode("sideways", m));
    EXPECT_STREQ(run_mode_str(RunMode::OUTBOUND), "outbound");
}
