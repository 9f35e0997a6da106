#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bfvm {

    // Base of everything the library throws; what() is the user-facing text.
    class VMError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class CompileError : public VMError {
    public:
        enum class Kind {
            UnclosedLeftBracket,
            UnexpectedRightBracket,
        };

        CompileError(Kind kind, uint32_t line, uint32_t col);

        [[nodiscard]] auto kind() const -> Kind { return m_kind; }
        [[nodiscard]] auto line() const -> uint32_t { return m_line; }
        [[nodiscard]] auto col() const -> uint32_t { return m_col; }

    private:
        Kind m_kind;
        uint32_t m_line;
        uint32_t m_col;
    };

    class RuntimeError : public VMError {
    public:
        enum class Kind {
            IO,
            PointerOverflow,
        };

        explicit RuntimeError(Kind kind, std::string cause = {});

        [[nodiscard]] auto kind() const -> Kind { return m_kind; }
        // Underlying I/O failure description, empty for PointerOverflow.
        [[nodiscard]] auto cause() const -> std::string const& { return m_cause; }

    private:
        Kind m_kind;
        std::string m_cause;
    };

    // Raised while turning IR into machine code.
    class GenerationError : public VMError {
    public:
        using VMError::VMError;
    };

}
