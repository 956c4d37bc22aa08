// Outbound export: select -> batch file -> marker -> upload -> mark SENT

#include <gtest/gtest.h>

#include "exchange/outbound_pipeline.hpp"
#include "fakes.hpp"

using namespace ifx;
using ifx::test::FakeTransferClient;
using ifx::test::InMemoryStore;
using ifx::test::TempDir;

namespace {

class OutboundPipelineTest : public ::testing::Test {
protected:
    TempDir tmp;
    InMemoryStore store;
    FakeTransferClient ftp{2};
    OutboundConfig cfg;
    RunContext ctx = RunContext::at(std::chrono::system_clock::time_point(
        std::chrono::seconds(1718000000)));

    void SetUp() override {
        cfg.staging_dir = tmp.sub("staging");
        cfg.archive_dir = tmp.sub("archive");
        cfg.remote_dir = "/out";
        ASSERT_TRUE(store.connect(DbConnection{}).ok());
    }

    void add_three_rows() {
        // Unordered on purpose; two rows carry the distinguished operand
        store.add_pending("200", "LP", "2024-01-01", "2024-03-31", "M3", "");
        store.add_pending("100", "QT", "2024-02-01", "2024-02-29", "KWH", "P02");
        store.add_pending("100", "LP", "2024-01-01", "2024-01-31", "KWH", "");
    }

    std::string expected_name() const { return "EXPORT_" + ctx.run_id + "_0001.txt"; }
};

// Accepts data files, rejects every marker upload
class MarkerFailingClient : public FakeTransferClient {
public:
    using FakeTransferClient::FakeTransferClient;

protected:
    Status try_upload(const std::string& local, const std::string& remote) override {
        if (remote.size() > 3 && remote.compare(remote.size() - 3, 3, ".ok") == 0) {
            return Status::failure(ErrorKind::TRANSFER, "552 quota exceeded");
        }
        return FakeTransferClient::try_upload(local, remote);
    }
};

} // namespace

TEST_F(OutboundPipelineTest, NoPendingRowsIsNothingToDo) {
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    EXPECT_EQ(r.outcome, OutboundOutcome::NOTHING_TO_DO);
    EXPECT_TRUE(r.status.ok());
    EXPECT_TRUE(ftp.ops.empty());
    EXPECT_TRUE(ifx::test::files_in(cfg.staging_dir).empty());
}

TEST_F(OutboundPipelineTest, ExportsOrderedBatchAndMarksRowsSent) {
    add_three_rows();
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    ASSERT_EQ(r.outcome, OutboundOutcome::EXPORTED) << r.status.error;
    EXPECT_EQ(r.batch.file_name, expected_name());
    EXPECT_EQ(r.batch.marker_name, "EXPORT_" + ctx.run_id + "_0001.ok");
    EXPECT_EQ(r.batch.record_count, 3);
    EXPECT_EQ(r.rows_marked, 3);
    EXPECT_EQ(r.batch.status, BatchStatus::ACKNOWLEDGED);

    const std::string data_path = "/out/" + expected_name();
    const std::string marker_path = "/out/" + r.batch.marker_name;
    ASSERT_TRUE(ftp.files.count(data_path));
    ASSERT_TRUE(ftp.files.count(marker_path));
    EXPECT_EQ(ftp.files[data_path],
              "100\tLP\t01.01.2024\t31.01.2024\tKWH\n"
              "100\tQT\t01.02.2024\t29.02.2024\tKWH\tP02\n"
              "200\tLP\t01.01.2024\t31.03.2024\tM3\n");
    EXPECT_TRUE(ftp.files[marker_path].empty());

    // The marker signals completeness, so it must arrive last
    EXPECT_LT(ftp.index_of("upload:" + data_path), ftp.index_of("upload:" + marker_path));

    for (const auto& row : store.outbound) {
        EXPECT_EQ(row.status, kStatusSent);
        EXPECT_EQ(row.sent_file_name, expected_name());
        EXPECT_EQ(row.sent_at, ctx.started_at);
    }

    EXPECT_TRUE(ifx::test::files_in(cfg.staging_dir).empty());
    EXPECT_EQ(ifx::test::files_in(cfg.archive_dir), std::vector<std::string>{expected_name()});
}

TEST_F(OutboundPipelineTest, SecondRunFindsNothingPending) {
    add_three_rows();
    OutboundPipeline pipeline(cfg, store, ftp);
    ASSERT_EQ(pipeline.run(ctx).outcome, OutboundOutcome::EXPORTED);
    EXPECT_EQ(pipeline.run(ctx).outcome, OutboundOutcome::NOTHING_TO_DO);
}

TEST_F(OutboundPipelineTest, RowInsertedAfterSelectStaysPending) {
    add_three_rows();
    // Same key as an exported row, different content
    bool inserted = false;
    store.after_select = [this, &inserted] {
        if (inserted) return;
        inserted = true;
        store.add_pending("100", "QT", "2024-02-01", "2024-02-29", "M3", "P03");
    };
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    ASSERT_EQ(r.outcome, OutboundOutcome::EXPORTED) << r.status.error;
    EXPECT_EQ(r.rows_marked, 3);
    ASSERT_EQ(store.outbound.size(), 4u);
    EXPECT_EQ(store.outbound[3].status, kStatusPending);
    EXPECT_TRUE(store.outbound[3].sent_file_name.empty());

    // It goes out with the next batch
    RunContext later = RunContext::at(ctx.started + std::chrono::seconds(1));
    OutboundResult next = pipeline.run(later);
    ASSERT_EQ(next.outcome, OutboundOutcome::EXPORTED);
    EXPECT_EQ(next.batch.record_count, 1);
    EXPECT_EQ(store.outbound[3].status, kStatusSent);
}

TEST_F(OutboundPipelineTest, SameSecondRunGetsNextSequence) {
    add_three_rows();
    OutboundPipeline pipeline(cfg, store, ftp);
    ASSERT_EQ(pipeline.run(ctx).outcome, OutboundOutcome::EXPORTED);

    store.add_pending("300", "LP", "2024-01-01", "2024-01-31", "KWH", "");
    OutboundResult second = pipeline.run(ctx);

    ASSERT_EQ(second.outcome, OutboundOutcome::EXPORTED) << second.status.error;
    EXPECT_EQ(second.batch.file_name, "EXPORT_" + ctx.run_id + "_0002.txt");
    EXPECT_EQ(second.batch.marker_name, "EXPORT_" + ctx.run_id + "_0002.ok");
    EXPECT_EQ(ftp.files["/out/" + expected_name()].find("300"), std::string::npos);
    EXPECT_EQ(ifx::test::files_in(cfg.archive_dir).size(), 2u);
}

TEST_F(OutboundPipelineTest, SequenceKeepsConfiguredWidth) {
    cfg.sequence_suffix = "01";
    OutboundPipeline pipeline(cfg, store, ftp);
    EXPECT_EQ(pipeline.batch_file_name(ctx, 7), "EXPORT_" + ctx.run_id + "_07.txt");

    ifx::test::write_file(std::filesystem::path(cfg.staging_dir) /
                          ("EXPORT_" + ctx.run_id + "_01.txt"), "x\n");
    std::string name;
    ASSERT_TRUE(pipeline.choose_batch_name(ctx, name).ok());
    EXPECT_EQ(name, "EXPORT_" + ctx.run_id + "_02.txt");
}

TEST_F(OutboundPipelineTest, UploadFailureLeavesRowsPending) {
    add_three_rows();
    ftp.always_fail.insert("upload");
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    EXPECT_EQ(r.outcome, OutboundOutcome::FAILED);
    EXPECT_EQ(r.status.kind, ErrorKind::TRANSFER);
    EXPECT_EQ(ftp.attempts["upload"], 2);
    for (const auto& row : store.outbound) EXPECT_EQ(row.status, kStatusPending);
    EXPECT_TRUE(ifx::test::files_in(cfg.staging_dir).empty());
    EXPECT_FALSE(r.delivered_unacknowledged);
}

TEST_F(OutboundPipelineTest, MarkerFailureLeavesRowsPending) {
    add_three_rows();
    MarkerFailingClient marker_ftp(2);
    OutboundPipeline pipeline(cfg, store, marker_ftp);
    OutboundResult r = pipeline.run(ctx);

    EXPECT_EQ(r.outcome, OutboundOutcome::FAILED);
    EXPECT_TRUE(marker_ftp.files.count("/out/" + expected_name()));
    EXPECT_FALSE(marker_ftp.files.count("/out/" + r.batch.marker_name));
    for (const auto& row : store.outbound) EXPECT_EQ(row.status, kStatusPending);
}

TEST_F(OutboundPipelineTest, FailedSentUpdateIsDeliveredUnacknowledged) {
    add_three_rows();
    store.mark_sent_fails = true;
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    EXPECT_EQ(r.outcome, OutboundOutcome::FAILED);
    EXPECT_EQ(r.status.kind, ErrorKind::PERSISTENCE);
    EXPECT_TRUE(r.delivered_unacknowledged);
    EXPECT_EQ(r.batch.status, BatchStatus::UPLOADED);
    EXPECT_TRUE(ftp.files.count("/out/" + expected_name()));
    for (const auto& row : store.outbound) EXPECT_EQ(row.status, kStatusPending);
    EXPECT_TRUE(r.to_json()["delivered_unacknowledged"].get<bool>());
}

TEST_F(OutboundPipelineTest, InvalidRowFailsBeforeAnyUpload) {
    add_three_rows();
    store.add_pending("300", "QT", "2024-01-01", "2024-01-31", "KWH", "");  // no period
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);

    EXPECT_EQ(r.outcome, OutboundOutcome::FAILED);
    EXPECT_EQ(r.status.kind, ErrorKind::VALIDATION);
    EXPECT_TRUE(ftp.ops.empty());
    EXPECT_TRUE(ifx::test::files_in(cfg.staging_dir).empty());
}

TEST_F(OutboundPipelineTest, SelectFailureIsReported) {
    store.select_fails = true;
    OutboundPipeline pipeline(cfg, store, ftp);
    OutboundResult r = pipeline.run(ctx);
    EXPECT_EQ(r.outcome, OutboundOutcome::FAILED);
    EXPECT_EQ(r.status.kind, ErrorKind::PERSISTENCE);
}

TEST_F(OutboundPipelineTest, FileNames) {
    OutboundPipeline pipeline(cfg, store, ftp);
    EXPECT_EQ(pipeline.batch_file_name(ctx), expected_name());
    EXPECT_EQ(pipeline.marker_file_name("EXPORT_20240101_000000_0001.txt"),
              "EXPORT_20240101_000000_0001.ok");
    EXPECT_TRUE(pipeline.is_batch_file("EXPORT_x.txt"));
    EXPECT_FALSE(pipeline.is_batch_file("OTHER_x.txt"));
    EXPECT_TRUE(pipeline.is_marker_file("EXPORT_x.ok"));
    EXPECT_EQ(ctx.run_id.size(), 15u);
}

TEST_F(OutboundPipelineTest, RecoveryArchivesAcknowledgedAndDeletesOthers) {
    store.add_pending("100", "LP", "2024-01-01", "2024-01-31", "KWH", "");
    store.outbound[0].status = kStatusSent;
    store.outbound[0].sent_file_name = "EXPORT_20240101_000000_0001.txt";

    namespace fs = std::filesystem;
    fs::path staging(cfg.staging_dir);
    ifx::test::write_file(staging / "EXPORT_20240101_000000_0001.txt", "sent\n");
    ifx::test::write_file(staging / "EXPORT_20240101_000000_0001.ok", "");
    ifx::test::write_file(staging / "EXPORT_20240102_000000_0001.txt", "unsent\n");
    ifx::test::write_file(staging / "EXPORT_20240103_000000_0001.ok", "");

    OutboundPipeline pipeline(cfg, store, ftp);
    std::vector<RecoveryAction> actions;
    ASSERT_TRUE(pipeline.recover_staging(actions).ok());

    EXPECT_TRUE(ifx::test::files_in(cfg.staging_dir).empty());
    EXPECT_EQ(ifx::test::files_in(cfg.archive_dir),
              std::vector<std::string>{"EXPORT_20240101_000000_0001.txt"});
    ASSERT_EQ(actions.size(), 3u);
    auto archived = std::count_if(actions.begin(), actions.end(),
        [](const RecoveryAction& a) { return a.action == "archived"; });
    EXPECT_EQ(archived, 1);
}
