#include <gtest/gtest.h>

#include "layers/output/output_layer.h"
#include "test_support.h"

namespace {

using application::DecodedRecord;
using application::Field;
using application::RecordStatus;

DecodedRecord makeRecord(std::chrono::system_clock::time_point time, int unitId, RecordStatus status,
                         std::vector<Field> fields) {
    DecodedRecord record;
    record.timestamp = time;
    record.unitId = unitId;
    record.status = status;
    record.fields = std::move(fields);
    return record;
}

TEST(OutputLayerTest, DailyPathUsesMonthFolder) {
    const auto time = testing_support::localTime(2024, 3, 5);
    const auto path = output::dailyCsvPath("/data/logger", "dc_meter_log", time);
    EXPECT_EQ(path, (std::filesystem::path("/data/logger") / "data" / "2024-03" / "2024-03-05_dc_meter_log.csv").string());
}

TEST(OutputLayerTest, DefaultHeaderWrapsFields) {
    const auto header = output::defaultHeader({"A", "B"});
    EXPECT_EQ(header, (std::vector<std::string>{"Datetime", "Device_ID", "A", "B", "Error"}));
    EXPECT_EQ(header.size(), 2 + application::kMetadataColumns);
}

TEST(OutputLayerTest, CsvEscapeQuotesSpecialCells) {
    EXPECT_EQ(output::csvEscape("plain"), "plain");
    EXPECT_EQ(output::csvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(output::csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(OutputLayerTest, WritesHeaderOnceAndNullsAsEmptyCells) {
    testing_support::TempFolder folder("csv_sink");
    testing_support::CapturedLog log;
    const auto now = testing_support::localTime(2024, 3, 5, 10, 15, 30);

    output::CsvOutputSink sink(folder.string(), "meter", {"Datetime", "Device_ID", "Energy", "Power", "Error"}, log.sink);
    sink.setClock([now]() { return now; });

    sink.append({
        makeRecord(now, 1, RecordStatus::Ok, {{"Energy", 1.5}, {"Power", std::int64_t{42}}}),
        makeRecord(now, 2, RecordStatus::DeviceError, {{"Energy", std::nullopt}, {"Power", std::nullopt}}),
    });
    sink.append({makeRecord(now, 3, RecordStatus::DecodeError, {{"Energy", std::nullopt}, {"Power", std::nullopt}})});
    sink.flush();

    const auto expectedPath = folder.path() / "data" / "2024-03" / "2024-03-05_meter.csv";
    EXPECT_EQ(sink.currentPath(), expectedPath.string());

    const auto lines = testing_support::readLines(expectedPath);
    ASSERT_EQ(lines.size(), 4U);
    EXPECT_EQ(lines[0], "Datetime,Device_ID,Energy,Power,Error");
    EXPECT_EQ(lines[1], "2024-03-05T10:15:30,1,1.5,42,No error");
    EXPECT_EQ(lines[2], "2024-03-05T10:15:30,2,,,Error");
    EXPECT_EQ(lines[3], "2024-03-05T10:15:30,3,,,Decode error");
}

TEST(OutputLayerTest, AppendsToExistingFileWithoutNewHeader) {
    testing_support::TempFolder folder("csv_existing");
    testing_support::CapturedLog log;
    const auto now = testing_support::localTime(2024, 7, 1, 8, 0, 0);
    const std::vector<std::string> header{"Datetime", "Device_ID", "V", "Error"};

    {
        output::CsvOutputSink first(folder.string(), "x", header, log.sink);
        first.setClock([now]() { return now; });
        first.append({makeRecord(now, 1, RecordStatus::Ok, {{"V", 1.0}})});
    }
    output::CsvOutputSink second(folder.string(), "x", header, log.sink);
    second.setClock([now]() { return now; });
    second.append({makeRecord(now, 1, RecordStatus::Ok, {{"V", 2.25}})});
    second.flush();

    const auto lines = testing_support::readLines(second.currentPath());
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[1], "2024-07-01T08:00:00,1,1,No error");
    EXPECT_EQ(lines[2], "2024-07-01T08:00:00,1,2.25,No error");
}

TEST(OutputLayerTest, SwitchesFileWhenDayChanges) {
    testing_support::TempFolder folder("csv_rollover");
    testing_support::CapturedLog log;
    auto now = testing_support::localTime(2024, 3, 31, 23, 59, 0);

    output::CsvOutputSink sink(folder.string(), "s", {"Datetime", "Device_ID", "V", "Error"}, log.sink);
    sink.setClock([&now]() { return now; });
    sink.append({makeRecord(now, 1, RecordStatus::Ok, {{"V", 1.0}})});

    now = testing_support::localTime(2024, 4, 1, 0, 1, 0);
    sink.append({makeRecord(now, 1, RecordStatus::Ok, {{"V", 2.0}})});
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(folder.path() / "data" / "2024-03" / "2024-03-31_s.csv"));
    const auto april = folder.path() / "data" / "2024-04" / "2024-04-01_s.csv";
    ASSERT_TRUE(std::filesystem::exists(april));
    EXPECT_EQ(testing_support::readLines(april).size(), 2U);
}

} // namespace
