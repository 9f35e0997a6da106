#pragma once

#include <cassert>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>

#include "compiler.hpp"
#include "error.hpp"
#include "interpreter.hpp"
#include "optimizer.hpp"
#include "options.hpp"
#include "vm.hpp"

inline constexpr std::string_view kHelloWorld =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]"
    ">>.>---.+++++++..+++.>>.<-.<.+++.------.--------.>>+.>++.";

struct RunResult {
    std::string output;
    bool ok = true;
    bfvm::RuntimeError::Kind kind = bfvm::RuntimeError::Kind::IO;
};

inline RunResult run_jit(std::string_view code, bool optimize, std::string const& input = "") {
    std::istringstream in(input);
    std::ostringstream out;
    RunResult ret;
    bfvm::VM vm(code, in, out, optimize);
    try {
        vm.run();
    } catch (bfvm::RuntimeError const& e) {
        ret.ok = false;
        ret.kind = e.kind();
    }
    ret.output = out.str();
    return ret;
}

inline RunResult run_interp(std::string_view code, bool optimize, std::string const& input = "") {
    std::istringstream in(input);
    std::ostringstream out;
    RunResult ret;
    auto bytecode = bfvm::compile(code);
    if (optimize)
        bfvm::optimize(bytecode);
    bfvm::Interpreter interp(bytecode, in, out);
    try {
        interp.run_until_end();
    } catch (bfvm::RuntimeError const& e) {
        ret.ok = false;
        ret.kind = e.kind();
    }
    ret.output = out.str();
    return ret;
}

// Stream buffer that refuses every read and write.
struct BrokenBuf : std::streambuf {
    int_type overflow(int_type) override { return traits_type::eof(); }
    int_type underflow() override { return traits_type::eof(); }
};
