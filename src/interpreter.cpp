#include "interpreter.hpp"
#include "error.hpp"
#include "ir.hpp"
#include "options.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <stack>

namespace bfvm {
    auto link_loops(std::span<IR const> bytecode) -> std::vector<size_t>;

    Interpreter::Interpreter(std::span<IR const> bytecode, std::istream& input, std::ostream& output) :
        m_ptr(0),
        m_ip(0),
        m_bytecode(bytecode),
        m_jumps(link_loops(bytecode)),
        m_input(input),
        m_output(output)
    {
        m_buffer.resize(kTapeSize, 0);
    }

    auto Interpreter::finished() const -> bool {
        return m_ip == m_bytecode.size();
    }
    auto Interpreter::run_one_step() -> bool {
        if (finished())
            return false;

        auto const ip = m_ip++;
        auto const c_inst = m_bytecode[ip];
        switch (c_inst.m_type) {
            case IR::Type::AddVal:
                m_buffer[m_ptr] += c_inst.m_count;
                break;
            case IR::Type::SubVal:
                m_buffer[m_ptr] -= c_inst.m_count;
                break;
            case IR::Type::AddPtr:
                if (c_inst.m_count >= m_buffer.size() - m_ptr)
                    throw RuntimeError(RuntimeError::Kind::PointerOverflow);
                m_ptr += c_inst.m_count;
                break;
            case IR::Type::SubPtr:
                if (c_inst.m_count > m_ptr)
                    throw RuntimeError(RuntimeError::Kind::PointerOverflow);
                m_ptr -= c_inst.m_count;
                break;
            case IR::Type::GetByte: {
                char ch;
                if (m_input.read(&ch, 1))
                    m_buffer[m_ptr] = uint8_t(ch);
                else if (m_input.bad())
                    throw RuntimeError(RuntimeError::Kind::IO, "failed to read from input");
                break;
            }
            case IR::Type::PutByte:
                if (!m_output.put(char(m_buffer[m_ptr])))
                    throw RuntimeError(RuntimeError::Kind::IO, "failed to write to output");
                break;
            case IR::Type::Jz:
                if (m_buffer[m_ptr] == 0)
                    m_ip = m_jumps[ip] + 1;
                break;
            case IR::Type::Jnz:
                if (m_buffer[m_ptr] != 0)
                    m_ip = m_jumps[ip] + 1;
                break;
        }

        return true;
    }
    void Interpreter::run_until_end() {
        while (this->run_one_step());
        if (!m_output.flush())
            throw RuntimeError(RuntimeError::Kind::IO, "failed to flush output");
    }

    auto link_loops(std::span<IR const> bytecode) -> std::vector<size_t> {
        std::vector<size_t> jumps(bytecode.size(), 0);
        std::stack<size_t> loop_stack;
        for (size_t i = 0; i < bytecode.size(); i++) {
            if (bytecode[i].m_type == IR::Type::Jz) {
                loop_stack.push( i );
            } else if (bytecode[i].m_type == IR::Type::Jnz) {
                if (loop_stack.empty())
                    throw VMError("malformed IR: Jnz without a matching Jz");
                auto loop_beg = loop_stack.top();
                loop_stack.pop();
                jumps[loop_beg] = i;
                jumps[i] = loop_beg;
            }
        }
        if (!loop_stack.empty())
            throw VMError("malformed IR: Jz without a matching Jnz");
        return jumps;
    }
}
