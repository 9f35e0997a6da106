#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "error.hpp"
#include "ir.hpp"

#include <asmjit/asmjit.h>

namespace bfvm {

    // Host routines the generated code calls. Each returns nullptr on success
    // or a heap allocated error whose ownership passes to the caller.
    struct HostCallbacks {
        using IOFunc = RuntimeError* (*)(void* vm, uint8_t* cell) noexcept;
        using FaultFunc = RuntimeError* (*)() noexcept;

        IOFunc getbyte;
        IOFunc putbyte;
        FaultFunc overflow;
    };

    class JIT {
    public:
        // vm is handed back untouched to the callbacks, tape_end is exclusive.
        using MFuncType = RuntimeError* (*)(void* vm, uint8_t* tape_start, uint8_t* tape_end);

        JIT(std::span<IR const> bytecode, HostCallbacks const& callbacks);
        ~JIT();
        JIT(JIT const&) = delete;
        JIT(JIT&&) = delete;
        JIT& operator = (JIT const&) = delete;
        JIT& operator = (JIT&&) = delete;

        [[nodiscard]] auto entry() const -> MFuncType { return m_entry; }
        [[nodiscard]] auto entry_offset() const -> size_t { return m_entry_offset; }
        [[nodiscard]] auto code_size() const -> size_t { return m_code_size; }

    private:
        void do_codegen(std::span<IR const> bytecode, HostCallbacks const& callbacks);

        asmjit::JitRuntime m_runtime;
        void* m_code = nullptr;
        MFuncType m_entry = nullptr;
        size_t m_entry_offset = 0;
        size_t m_code_size = 0;
    };

}
