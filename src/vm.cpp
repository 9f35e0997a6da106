#include "vm.hpp"
#include "compiler.hpp"
#include "error.hpp"
#include "optimizer.hpp"
#include "options.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <system_error>
#include <fmt/format.h>

namespace bfvm {

    VM::VM(std::string_view program, std::istream& input, std::ostream& output, bool optimize) :
        m_ir(compile(program)),
        m_input(input),
        m_output(output)
    {
        if (optimize)
            bfvm::optimize(m_ir);
        m_jit = std::make_unique<JIT>(m_ir, HostCallbacks{
            .getbyte = &VM::getbyte,
            .putbyte = &VM::putbyte,
            .overflow = &VM::overflow_error,
        });
        m_tape.resize(kTapeSize, 0);
    }
    VM::~VM() = default;

    auto VM::from_file(std::filesystem::path const& path, std::istream& input,
                       std::ostream& output, bool optimize) -> std::unique_ptr<VM> {
        auto const program = load_program(path);
        return std::make_unique<VM>(program, input, output, optimize);
    }

    void VM::run() {
        if (m_running.exchange(true))
            throw VMError("VM is already running");

        if (m_dirty)
            std::fill(m_tape.begin(), m_tape.end(), uint8_t(0));
        m_dirty = true;

        auto* const tape_start = m_tape.data();
        auto* const tape_end = tape_start + m_tape.size();
        std::unique_ptr<RuntimeError> err( m_jit->entry()(this, tape_start, tape_end) );
        m_running = false;

        if (!m_output.flush() && !err)
            throw RuntimeError(RuntimeError::Kind::IO, "failed to flush output");
        if (err)
            throw RuntimeError(*err);
    }

    auto VM::getbyte(void* vm, uint8_t* cell) noexcept -> RuntimeError* {
        auto& self = *static_cast<VM*>(vm);
        try {
            char ch;
            if (self.m_input.read(&ch, 1))
                *cell = uint8_t(ch);
            else if (self.m_input.bad())
                return new RuntimeError(RuntimeError::Kind::IO, "failed to read from input");
            // end of input keeps the cell as it was
        } catch (std::exception const& e) {
            return new RuntimeError(RuntimeError::Kind::IO, e.what());
        }
        return nullptr;
    }

    auto VM::putbyte(void* vm, uint8_t* cell) noexcept -> RuntimeError* {
        auto& self = *static_cast<VM*>(vm);
        try {
            if (!self.m_output.put(char(*cell)))
                return new RuntimeError(RuntimeError::Kind::IO, "failed to write to output");
        } catch (std::exception const& e) {
            return new RuntimeError(RuntimeError::Kind::IO, e.what());
        }
        return nullptr;
    }

    auto VM::overflow_error() noexcept -> RuntimeError* {
        return new RuntimeError(RuntimeError::Kind::PointerOverflow);
    }

    auto load_program(std::filesystem::path const& path) -> std::string {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw VMError(fmt::format("IO: {} is not a regular file", path.string()));
        auto handle = std::ifstream(path, std::ios::binary);
        if (!handle)
            throw VMError(fmt::format("IO: cannot read {}", path.string()));
        return std::string(std::istreambuf_iterator<char>(handle), std::istreambuf_iterator<char>());
    }

}
