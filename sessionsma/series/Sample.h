#pragma once

#include "Timestamp.h"

#include <ostream>

struct Sample
{
    Timestamp timestamp;
    double price = 0.;

    bool operator==(const Sample & other) const = default;
};

std::ostream & operator<<(std::ostream & os, const Sample & sample);
