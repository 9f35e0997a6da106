#pragma once

#include "ir.hpp"
#include <vector>

namespace bfvm {

    // Folds each maximal run of the same counted instruction into one,
    // summing the counts modulo 256. Runs in place and is idempotent.
    void optimize(std::vector<IR>& buffer);

}
