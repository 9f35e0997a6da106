#include "compiler.hpp"
#include "error.hpp"
#include "ir.hpp"

#include <algorithm>
#include <cstdint>
#include <stack>

namespace bfvm {

    struct OpenBracket {
        size_t pos;
        uint32_t line;
        uint32_t col;
    };

    auto compile(std::string_view program) -> std::vector<IR> {
        auto ret = std::vector<IR>();
        ret.reserve(std::min<size_t>(program.size(), 1024 * 1024));

        std::stack<OpenBracket> loop_stack;
        uint32_t line = 1;
        uint32_t col = 0;

        for (auto const& ch : program) {
            // columns count UTF-8 characters, not continuation bytes
            if ((uint8_t(ch) & 0xC0) != 0x80)
                col++;
            switch (ch) {
                case '\n':
                    line++;
                    col = 0;
                    break;
                case '+': ret.push_back( AddVal(1) ); break;
                case '-': ret.push_back( SubVal(1) ); break;
                case '>': ret.push_back( AddPtr(1) ); break;
                case '<': ret.push_back( SubPtr(1) ); break;
                case ',': ret.push_back( GetByte ); break;
                case '.': ret.push_back( PutByte ); break;
                case '[':
                    loop_stack.push( OpenBracket{ .pos = ret.size(), .line = line, .col = col } );
                    ret.push_back( Jz );
                    break;
                case ']':
                    if (loop_stack.empty())
                        throw CompileError(CompileError::Kind::UnexpectedRightBracket, line, col);
                    loop_stack.pop();
                    ret.push_back( Jnz );
                    break;
                default: break;
            }
        }

        // innermost bracket that is still open
        if (!loop_stack.empty()) {
            auto const& open = loop_stack.top();
            throw CompileError(CompileError::Kind::UnclosedLeftBracket, open.line, open.col);
        }

        return ret;
    }

}
