#include "CsvAuditSink.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

class CsvAuditSinkTest : public testing::Test
{
public:
    static AuditRow make_row()
    {
        AuditRow row;
        row.index = 1;
        row.timestamp = Timestamp{1000.5};
        row.date_time = "2025-04-04 09:31:00";
        row.gap_from_now = Timestamp{12.};
        row.session = SessionLabel::Morning;
        row.is_trading = true;
        row.price = 100.456;
        row.sma = 100.;
        row.point_kind = PointKind::Original;
        row.boundary = BoundaryTag{.crosses_day = true, .crosses_session = true};
        return row;
    }

    static std::vector<std::string> lines(const std::string & str)
    {
        std::vector<std::string> res;
        std::istringstream ss(str);
        std::string line;
        while (std::getline(ss, line)) {
            res.push_back(line);
        }
        return res;
    }
};

TEST_F(CsvAuditSinkTest, HeaderOnConstruction)
{
    std::ostringstream out;
    CsvAuditSink sink(out);

    EXPECT_EQ(out.str(), "index,timestamp,date_time,gap_s,session,is_trading,price,sma,point_type,boundary\n");
    EXPECT_EQ(sink.rows_written(), 0);
}

TEST_F(CsvAuditSinkTest, RowFormat)
{
    EXPECT_EQ(CsvAuditSink::format_row(make_row()),
              R"(1,1000.5,2025-04-04 09:31:00,12.0,morning,yes,100.46,100.00,original,"crosses day, crosses session")");

    auto row = make_row();
    row.point_kind = PointKind::Supplemental;
    row.boundary = {};
    row.is_trading = false;
    row.session = SessionLabel::Afternoon;
    EXPECT_EQ(CsvAuditSink::format_row(row),
              "1,1000.5,2025-04-04 09:31:00,12.0,afternoon,no,100.46,100.00,supplemental,same day same session");
}

TEST_F(CsvAuditSinkTest, WindowsAreAppended)
{
    std::ostringstream out;
    CsvAuditSink sink(out);

    auto second = make_row();
    second.index = 2;
    sink.on_window({make_row(), second});
    sink.on_window({make_row()});

    const auto written = lines(out.str());
    ASSERT_EQ(written.size(), 4);
    EXPECT_EQ(written[1].substr(0, 2), "1,");
    EXPECT_EQ(written[2].substr(0, 2), "2,");
    EXPECT_EQ(written[3].substr(0, 2), "1,");
    EXPECT_EQ(sink.rows_written(), 3);
}

TEST_F(CsvAuditSinkTest, OpenFile)
{
    const auto path = std::filesystem::temp_directory_path() / "sessionsma_audit_test.csv";
    {
        auto sink = CsvAuditSink::open(path);
        ASSERT_TRUE(sink != nullptr);
        sink->on_window({make_row()});
        sink->on_window({make_row(), make_row()});
        EXPECT_EQ(sink->rows_written(), 3);
    }

    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    const auto file_lines = lines(ss.str());
    ASSERT_EQ(file_lines.size(), 4);
    EXPECT_EQ(file_lines[0], "index,timestamp,date_time,gap_s,session,is_trading,price,sma,point_type,boundary");
    EXPECT_EQ(file_lines[1], CsvAuditSink::format_row(make_row()));

    std::filesystem::remove(path);
}

TEST_F(CsvAuditSinkTest, OpenFailsForMissingDirectory)
{
    const auto path = std::filesystem::temp_directory_path() / "sessionsma_no_such_dir" / "audit.csv";
    EXPECT_TRUE(CsvAuditSink::open(path) == nullptr);
}
