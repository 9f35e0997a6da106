#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "ir.hpp"
#include "jit.hpp"

namespace bfvm {

    // Compiles a program to native code once and runs it against a private
    // tape. Not copyable, not movable: generated code holds its address.
    class VM {
    public:
        VM(std::string_view program, std::istream& input, std::ostream& output, bool optimize);
        ~VM();
        VM(VM const&) = delete;
        VM(VM&&) = delete;
        VM& operator = (VM const&) = delete;
        VM& operator = (VM&&) = delete;

        [[nodiscard]]
        static auto from_file(std::filesystem::path const& path, std::istream& input,
                              std::ostream& output, bool optimize) -> std::unique_ptr<VM>;

        // Throws RuntimeError if the program faults. A later call starts
        // over on a zeroed tape.
        void run();

        [[nodiscard]] auto tape() const -> std::span<uint8_t const> { return m_tape; }
        [[nodiscard]] auto ir() const -> std::span<IR const> { return m_ir; }
        [[nodiscard]] auto code_size() const -> size_t { return m_jit->code_size(); }

    private:
        static auto getbyte(void* vm, uint8_t* cell) noexcept -> RuntimeError*;
        static auto putbyte(void* vm, uint8_t* cell) noexcept -> RuntimeError*;
        static auto overflow_error() noexcept -> RuntimeError*;

        std::vector<IR> m_ir;
        std::unique_ptr<JIT> m_jit;
        std::vector<uint8_t> m_tape;
        std::istream& m_input;
        std::ostream& m_output;
        std::atomic<bool> m_running = false;
        bool m_dirty = false;
    };

    [[nodiscard]]
    auto load_program(std::filesystem::path const& path) -> std::string;

}
