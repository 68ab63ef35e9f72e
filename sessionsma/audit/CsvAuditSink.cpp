#include "CsvAuditSink.h"

#include "Logger.h"

#include <fmt/core.h>

#include <sstream>
#include <utility>

namespace {
constexpr std::string_view s_header = "index,timestamp,date_time,gap_s,session,is_trading,price,sma,point_type,boundary";

template <class T>
std::string stream_to_string(const T & v)
{
    std::stringstream ss;
    ss << v;
    return ss.str();
}
} // namespace

CsvAuditSink::CsvAuditSink(std::ostream & out)
    : m_out(out)
{
    m_out << s_header << '\n';
}

CsvAuditSink::CsvAuditSink(FileTag, std::unique_ptr<std::ofstream> file)
    : m_file(std::move(file))
    , m_out(*m_file)
{
    m_out << s_header << '\n';
}

std::unique_ptr<CsvAuditSink> CsvAuditSink::open(const std::filesystem::path & path)
{
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!file->is_open()) {
        LOG_ERROR("Can't open audit file {}", path.string());
        return nullptr;
    }
    LOG_INFO("Writing audit rows to {}", path.string());
    return std::make_unique<CsvAuditSink>(FileTag{}, std::move(file));
}

std::string CsvAuditSink::quoted(std::string_view field)
{
    if (field.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string res = "\"";
    for (const char c : field) {
        if (c == '"') {
            res += '"';
        }
        res += c;
    }
    res += '"';
    return res;
}

std::string CsvAuditSink::format_row(const AuditRow & row)
{
    return fmt::format("{},{},{},{:.1f},{},{},{:.2f},{:.2f},{},{}",
                       row.index,
                       row.timestamp.count(),
                       quoted(row.date_time),
                       row.gap_from_now.count(),
                       to_string(row.session),
                       row.is_trading ? "yes" : "no",
                       row.price,
                       row.sma,
                       stream_to_string(row.point_kind),
                       quoted(stream_to_string(row.boundary)));
}

void CsvAuditSink::on_window(const std::vector<AuditRow> & rows)
{
    for (const auto & row : rows) {
        m_out << format_row(row) << '\n';
    }
    m_out.flush();
    m_rows_written += rows.size();

    if (!m_out) {
        LOG_ERROR("Failed to write {} audit rows", rows.size());
    }
}
