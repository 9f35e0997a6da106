#include "jit.hpp"
#include "error.hpp"
#include "ir.hpp"

#include <cstdint>
#include <fmt/format.h>

#include <stack>
#include <utility>

#if !defined(__x86_64__) || defined(_WIN32)
#error "bfvm only generates code for the x86-64 System V ABI"
#endif

// Pinned registers. The program only ever has one live value (the data
// pointer) plus three invariants, so nothing is ever spilled. All four are
// callee-saved: the host callbacks preserve them, so the pointer survives
// every call without an explicit save. Adding any other live value needs a
// real register allocator.
namespace x64 = asmjit::x86;
constexpr auto VM_HANDLE  = x64::r12;
constexpr auto TAPE_START = x64::r13;
constexpr auto TAPE_END   = x64::r14;
constexpr auto DATA_PTR   = x64::r15;

struct EHandler : public asmjit::ErrorHandler {
    void handleError(asmjit::Error err, char const* msg, asmjit::BaseEmitter*) override {
        throw bfvm::GenerationError(fmt::format("asmjit: {} ({})", msg, err));
    }
};

// Rejects IR whose Jz/Jnz do not nest; the label stack below depends on it.
void check_brackets(std::span<bfvm::IR const> code);

void emit_call(x64::Assembler& a, bfvm::HostCallbacks::IOFunc func, asmjit::Label& exit);

namespace bfvm {

    JIT::JIT(std::span<IR const> bytecode, HostCallbacks const& callbacks) {
        check_brackets(bytecode);
        do_codegen(bytecode, callbacks);
    }
    JIT::~JIT() {
        if (m_code)
            m_runtime.release(m_code);
    }

    void JIT::do_codegen(std::span<IR const> bytecode, HostCallbacks const& callbacks) {
        EHandler ehandler;

        asmjit::CodeHolder code_holder;
        code_holder.init(m_runtime.environment());
        code_holder.setErrorHandler(&ehandler);

        x64::Assembler a(&code_holder);

        auto exit_label = a.newLabel();
        auto overflow_label = a.newLabel();

        m_entry_offset = a.offset();
        // 4 pushes + the return address leave rsp 8 bytes off a 16 byte boundary
        a.push(VM_HANDLE);
        a.push(TAPE_START);
        a.push(TAPE_END);
        a.push(DATA_PTR);
        a.sub(x64::rsp, 8);

        a.mov(VM_HANDLE, x64::rdi);
        a.mov(TAPE_START, x64::rsi);
        a.mov(TAPE_END, x64::rdx);
        a.mov(DATA_PTR, x64::rsi);

        std::stack<std::pair<asmjit::Label, asmjit::Label>> loop_labels;
        for (auto const& op : bytecode) {
            switch (op.m_type) {
            case IR::Type::AddPtr:
                if (op.m_count == 0)
                    break;
                a.add(DATA_PTR, asmjit::Imm(op.m_count));
                a.jc(overflow_label);
                a.cmp(DATA_PTR, TAPE_END);
                a.jae(overflow_label);
                break;
            case IR::Type::SubPtr:
                if (op.m_count == 0)
                    break;
                a.sub(DATA_PTR, asmjit::Imm(op.m_count));
                a.jc(overflow_label);
                a.cmp(DATA_PTR, TAPE_START);
                a.jb(overflow_label);
                break;
            case IR::Type::AddVal:
                if (op.m_count != 0)
                    a.add(x64::byte_ptr(DATA_PTR), asmjit::Imm(int8_t(op.m_count)));
                break;
            case IR::Type::SubVal:
                if (op.m_count != 0)
                    a.sub(x64::byte_ptr(DATA_PTR), asmjit::Imm(int8_t(op.m_count)));
                break;
            case IR::Type::GetByte:
                emit_call(a, callbacks.getbyte, exit_label);
                break;
            case IR::Type::PutByte:
                emit_call(a, callbacks.putbyte, exit_label);
                break;
            case IR::Type::Jz: {
                auto start = a.newLabel();
                auto end = a.newLabel();
                a.cmp(x64::byte_ptr(DATA_PTR), asmjit::Imm(0));
                a.je(end);
                a.bind(start);
                loop_labels.push({ start, end });
                break;
            }
            case IR::Type::Jnz: {
                auto const [start, end] = loop_labels.top();
                loop_labels.pop();
                a.cmp(x64::byte_ptr(DATA_PTR), asmjit::Imm(0));
                a.jne(start);
                a.bind(end);
                break;
            }
            }
        }

        // rax carries the result to the shared exit: null or an owned error
        a.xor_(x64::eax, x64::eax);
        a.bind(exit_label);
        a.add(x64::rsp, 8);
        a.pop(DATA_PTR);
        a.pop(TAPE_END);
        a.pop(TAPE_START);
        a.pop(VM_HANDLE);
        a.ret();

        a.bind(overflow_label);
        a.mov(x64::rax, asmjit::Imm(reinterpret_cast<uintptr_t>(callbacks.overflow)));
        a.call(x64::rax);
        a.jmp(exit_label);

        void* func = nullptr;
        auto const err = m_runtime.add(&func, &code_holder);
        if (err)
            throw GenerationError(fmt::format("asmjit: cannot install code ({})", asmjit::DebugUtils::errorAsString(err)));

        m_code = func;
        m_code_size = code_holder.codeSize();
        m_entry = reinterpret_cast<MFuncType>(static_cast<uint8_t*>(func) + m_entry_offset);
    }

}

void emit_call(x64::Assembler& a, bfvm::HostCallbacks::IOFunc func, asmjit::Label& exit) {
    a.mov(x64::rdi, VM_HANDLE);
    a.mov(x64::rsi, DATA_PTR);
    a.mov(x64::rax, asmjit::Imm(reinterpret_cast<uintptr_t>(func)));
    a.call(x64::rax);
    // a non-null result is already the error this function returns
    a.test(x64::rax, x64::rax);
    a.jnz(exit);
}

void check_brackets(std::span<bfvm::IR const> code) {
    size_t depth = 0;
    for (auto const& op : code) {
        if (op.m_type == bfvm::IR::Type::Jz) {
            depth++;
        } else if (op.m_type == bfvm::IR::Type::Jnz) {
            if (depth == 0)
                throw bfvm::GenerationError("malformed IR: Jnz without a matching Jz");
            depth--;
        }
    }
    if (depth != 0)
        throw bfvm::GenerationError("malformed IR: Jz without a matching Jnz");
}
