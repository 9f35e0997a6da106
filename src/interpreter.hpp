#pragma once

#include "ir.hpp"
#include <cstdint>
#include <iosfwd>
#include <vector>
#include <span>

namespace bfvm {

    // Straightforward IR walker with the same observable behaviour as the
    // generated code. Used to cross-check the JIT and from the CLI with -i.
    struct Interpreter {
        std::vector<uint8_t> m_buffer;
        size_t m_ptr;
        size_t m_ip;
        std::span<IR const> m_bytecode;
        // matching bracket for every Jz/Jnz, unused for other instructions
        std::vector<size_t> m_jumps;
        std::istream& m_input;
        std::ostream& m_output;

        Interpreter(std::span<IR const> bytecode, std::istream& input, std::ostream& output);

        // Throws RuntimeError on pointer overflow or a stream failure.
        void run_until_end();

        [[nodiscard]]
        auto run_one_step() -> bool;
        [[nodiscard]]
        auto finished() const -> bool;
        [[nodiscard]]
        auto tape() const -> std::span<uint8_t const> { return m_buffer; }
    };

}
