#pragma once

#include "error.hpp"
#include "ir.hpp"

#include <string_view>
#include <vector>

namespace bfvm {

    // Throws CompileError on the first unbalanced bracket.
    [[nodiscard]]
    auto compile(std::string_view program) -> std::vector<IR>;

}
