#pragma once

#include "AuditRow.h"

#include <vector>

class IAuditSink
{
public:
    virtual ~IAuditSink() = default;

    // rows of one MovingAverageEngine::get() call, in visit order
    virtual void on_window(const std::vector<AuditRow> & rows) = 0;
};
