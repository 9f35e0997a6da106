#pragma once

#include <cstdint>
#include <cstdio>
#include <span>
#include <string_view>

#include <fmt/format.h>

namespace bfvm {

    struct IR {
        enum class Type : uint8_t {
            AddVal,     // +
            SubVal,     // -
            AddPtr,     // >
            SubPtr,     // <
            GetByte,    // ,
            PutByte,    // .
            Jz,         // [
            Jnz,        // ]
        } m_type;
        // repetition count, only meaningful for the four counted types
        uint8_t m_count = 0;

        [[nodiscard]]
        auto is_counted() const -> bool;

        friend auto operator == (IR const&, IR const&) -> bool = default;
    };

    [[nodiscard]] constexpr auto AddVal(uint8_t n) -> IR { return IR{ .m_type = IR::Type::AddVal, .m_count = n }; }
    [[nodiscard]] constexpr auto SubVal(uint8_t n) -> IR { return IR{ .m_type = IR::Type::SubVal, .m_count = n }; }
    [[nodiscard]] constexpr auto AddPtr(uint8_t n) -> IR { return IR{ .m_type = IR::Type::AddPtr, .m_count = n }; }
    [[nodiscard]] constexpr auto SubPtr(uint8_t n) -> IR { return IR{ .m_type = IR::Type::SubPtr, .m_count = n }; }
    inline constexpr IR GetByte = IR{ .m_type = IR::Type::GetByte };
    inline constexpr IR PutByte = IR{ .m_type = IR::Type::PutByte };
    inline constexpr IR Jz      = IR{ .m_type = IR::Type::Jz };
    inline constexpr IR Jnz     = IR{ .m_type = IR::Type::Jnz };

    [[nodiscard]]
    auto type_name(IR::Type type) -> std::string_view;

    // Prints one instruction per line, loop bodies indented one space per level.
    void print_ir(std::span<IR const> code, std::FILE* out = stdout);

}

template <>
struct fmt::formatter<bfvm::IR::Type> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(bfvm::IR::Type type, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(bfvm::type_name(type), ctx);
    }
};

template <>
struct fmt::formatter<bfvm::IR> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(bfvm::IR const& ir, FormatContext& ctx) const {
        if (ir.is_counted())
            return fmt::format_to(ctx.out(), "{}({})", ir.m_type, ir.m_count);
        return fmt::format_to(ctx.out(), "{}", ir.m_type);
    }
};
