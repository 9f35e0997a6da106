#include "optimizer.hpp"
#include "ir.hpp"

#include <cstdint>
#include <span>

namespace bfvm {
    auto match_many(std::span<IR const> code, IR::Type type) -> size_t;

    void optimize(std::vector<IR>& buffer) {
        size_t out = 0;
        size_t i = 0;
        while (i < buffer.size()) {
            auto const op = buffer[i];
            if (!op.is_counted()) {
                buffer[out++] = op;
                i++;
                continue;
            }

            auto const rep = match_many(std::span<IR const>(buffer).subspan(i), op.m_type);
            uint8_t acc = 0;
            for (size_t j = i; j < i + rep; j++)
                acc = uint8_t(acc + buffer[j].m_count);
            buffer[out++] = IR{ .m_type = op.m_type, .m_count = acc };
            i += rep;
        }
        buffer.resize(out);
    }

    auto match_many(std::span<IR const> code, IR::Type type) -> size_t {
        size_t ret = 0;
        for (size_t i = 0; i < code.size(); i++) {
            if (code[i].m_type != type)
                return ret;
            else
                ret++;
        }
        return ret;
    }

}
