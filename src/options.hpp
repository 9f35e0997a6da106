#pragma once

#include <cstddef>

#ifndef BFVM_TAPE_SIZE
#define BFVM_TAPE_SIZE (4 * 1024 * 1024)
#endif

namespace bfvm {

    // Number of cells on the tape; set at configure time, never at runtime.
    inline constexpr size_t kTapeSize = BFVM_TAPE_SIZE;
    static_assert(kTapeSize > 0, "tape needs at least one cell");

    struct CLIOpts {
        bool optimize = false;
        bool run_interpreter = false;
        bool print_and_exit = false;
        bool debug_info = false;
    };

}
