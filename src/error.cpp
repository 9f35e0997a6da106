#include "error.hpp"

#include <utility>
#include <fmt/format.h>

namespace bfvm {

    auto describe(CompileError::Kind kind) -> char const* {
        switch (kind) {
            case CompileError::Kind::UnclosedLeftBracket:    return "Unclosed left bracket";
            case CompileError::Kind::UnexpectedRightBracket: return "Unexpected right bracket";
        }
        return "Unknown compile error";
    }

    auto describe(RuntimeError::Kind kind, std::string const& cause) -> std::string {
        if (kind == RuntimeError::Kind::PointerOverflow)
            return "Pointer overflow";
        return fmt::format("IO: {}", cause);
    }

    CompileError::CompileError(Kind kind, uint32_t line, uint32_t col) :
        VMError(fmt::format("Compile: {} at line {}:{}", describe(kind), line, col)),
        m_kind(kind),
        m_line(line),
        m_col(col)
    {}

    RuntimeError::RuntimeError(Kind kind, std::string cause) :
        VMError(fmt::format("Runtime: {}", describe(kind, cause))),
        m_kind(kind),
        m_cause(std::move(cause))
    {}

}
