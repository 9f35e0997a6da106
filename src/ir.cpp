#include "ir.hpp"

#include <cstdio>
#include <fmt/format.h>

namespace bfvm {

    auto IR::is_counted() const -> bool {
        switch (m_type) {
            case Type::AddVal:
            case Type::SubVal:
            case Type::AddPtr:
            case Type::SubPtr:
                return true;
            default:
                return false;
        }
    }

    auto type_name(IR::Type type) -> std::string_view {
        switch (type) {
            case IR::Type::AddVal:  return "AddVal";
            case IR::Type::SubVal:  return "SubVal";
            case IR::Type::AddPtr:  return "AddPtr";
            case IR::Type::SubPtr:  return "SubPtr";
            case IR::Type::GetByte: return "GetByte";
            case IR::Type::PutByte: return "PutByte";
            case IR::Type::Jz:      return "Jz";
            case IR::Type::Jnz:     return "Jnz";
        }
        return "?";
    }

    void print_ir(std::span<IR const> code, std::FILE* out) {
        size_t depth = 0;
        for (auto const& ir : code) {
            if (ir.m_type == IR::Type::Jnz && depth > 0)
                depth--;
            for (size_t j = 0; j < depth; j++) fmt::print(out, " ");
            fmt::print(out, "<{}>\n", ir);
            if (ir.m_type == IR::Type::Jz)
                depth++;
        }
    }

}
