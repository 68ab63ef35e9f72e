#pragma once

#include "IAuditSink.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/*
    index,timestamp,date_time,gap_s,session,is_trading,price,sma,point_type,boundary
    The header is written on construction, the stream is flushed after every window.
*/
class CsvAuditSink final : public IAuditSink
{
    struct FileTag
    {
        explicit FileTag() = default;
    };

public:
    CsvAuditSink(std::ostream & out);
    // reachable through open() only
    CsvAuditSink(FileTag, std::unique_ptr<std::ofstream> file);

    // nullptr if the file can't be opened
    static std::unique_ptr<CsvAuditSink> open(const std::filesystem::path & path);

    void on_window(const std::vector<AuditRow> & rows) override;

    size_t rows_written() const { return m_rows_written; }

    static std::string format_row(const AuditRow & row);

private:
    static std::string quoted(std::string_view field);

private:
    std::unique_ptr<std::ofstream> m_file;
    std::ostream & m_out;
    size_t m_rows_written = 0;
};
