#include "AuditRow.h"

std::ostream & operator<<(std::ostream & os, PointKind kind)
{
    switch (kind) {
    case PointKind::Original:
        os << "original";
        break;
    case PointKind::Supplemental:
        os << "supplemental";
        break;
    }
    return os;
}

std::ostream & operator<<(std::ostream & os, const BoundaryTag & tag)
{
    if (!tag.crosses_day && !tag.crosses_session) {
        return os << "same day same session";
    }
    if (tag.crosses_day) {
        os << "crosses day";
    }
    if (tag.crosses_day && tag.crosses_session) {
        os << ", ";
    }
    if (tag.crosses_session) {
        os << "crosses session";
    }
    return os;
}
