#include "fops/events/json_codec.hpp"

#include <gtest/gtest.h>

using namespace fops::events;
using fops::Error;
using fops::ops::ConflictRecord;
using fops::ops::OperationKind;

TEST(JsonCodecTest, ConflictCarriesComparisonFields) {
    ConflictRecord conflict;
    conflict.source_path = "/src/report.pdf";
    conflict.destination_path = "/dst/report.pdf";
    conflict.source_size = 100;
    conflict.destination_size = 250;
    conflict.source_modified = std::chrono::system_clock::time_point(std::chrono::seconds(1000));
    conflict.destination_modified = std::chrono::system_clock::time_point(std::chrono::seconds(2000));

    auto j = event_to_json(ConflictDetectedEvent{"op-1", conflict});

    EXPECT_EQ(j["type"], "conflictDetected");
    EXPECT_EQ(j["sourcePath"], "/src/report.pdf");
    EXPECT_EQ(j["destinationPath"], "/dst/report.pdf");
    EXPECT_EQ(j["sourceModified"], 1000000);
    EXPECT_EQ(j["destinationIsNewer"], true);
    EXPECT_EQ(j["sizeDifference"], 150);
}

TEST(JsonCodecTest, FailedEventEmbedsError) {
    auto j = event_to_json(OperationFailedEvent{"op-2", OperationKind::Copy,
                                                Error::insufficient_space(2048, 1024, "Backup")});

    EXPECT_EQ(j["type"], "operationFailed");
    EXPECT_EQ(j["kind"], "copy");
    EXPECT_EQ(j["error"]["kind"], "insufficientSpace");
    EXPECT_EQ(j["error"]["required"], 2048);
    EXPECT_EQ(j["error"]["available"], 1024);
    EXPECT_EQ(j["error"]["volume"], "Backup");
}

TEST(JsonCodecTest, DryRunListsSampledConflicts) {
    DryRunCompletedEvent event{};
    event.operation_id = "op-3";
    event.kind = OperationKind::Move;
    event.files_total = 12;
    event.conflicts_total = 5;
    event.conflicts.resize(2);
    event.conflicts_sampled = true;

    auto j = event_to_json(event);

    EXPECT_EQ(j["type"], "dryRunCompleted");
    EXPECT_EQ(j["filesTotal"], 12);
    EXPECT_EQ(j["conflictsTotal"], 5);
    EXPECT_EQ(j["conflicts"].size(), 2u);
    EXPECT_EQ(j["conflictsSampled"], true);
}

TEST(JsonCodecTest, CancelledEventReportsRollback) {
    auto j = event_to_json(OperationCancelledEvent{"op-4", OperationKind::Delete, 7, false});
    EXPECT_EQ(j["itemsProcessed"], 7);
    EXPECT_EQ(j["rolledBack"], false);
}
