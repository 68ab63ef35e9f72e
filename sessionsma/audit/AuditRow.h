#pragma once

#include "Timestamp.h"
#include "TradingCalendar.h"

#include <cstddef>
#include <ostream>
#include <string>

enum class PointKind
{
    Original,     // a stored sample lies at the instant
    Supplemental, // forward-filled
};

std::ostream & operator<<(std::ostream & os, PointKind kind);

struct BoundaryTag
{
    bool crosses_day = false;
    bool crosses_session = false;

    bool operator==(const BoundaryTag & other) const = default;
};

// "same day same session", "crosses day", "crosses session" or "crosses day, crosses session"
std::ostream & operator<<(std::ostream & os, const BoundaryTag & tag);

struct AuditRow
{
    size_t index = 0; // 1-based
    Timestamp timestamp;
    std::string date_time;
    Timestamp gap_from_now;
    SessionLabel session = SessionLabel::Morning;
    bool is_trading = false;
    double price = 0.;
    double sma = 0.;
    PointKind point_kind = PointKind::Supplemental;
    BoundaryTag boundary;
};
