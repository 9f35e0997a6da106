#include "compiler.hpp"
#include "error.hpp"
#include "interpreter.hpp"
#include "ir.hpp"
#include "optimizer.hpp"
#include "options.hpp"
#include "vm.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <fmt/color.h>

void print_usage(char const* argv);
void print_error(std::string_view msg);
int run(char const* program_path, bfvm::CLIOpts const& cli_opts);

int main(int const argc, char const *argv[]) {
    char const* program_path = nullptr;
    bfvm::CLIOpts cli_opts;

    for (int i = 1; i < argc; i++) {
        auto arg = std::string_view{ argv[i] };
        if (arg.starts_with("-")) {
            if (arg == "-o") {
                cli_opts.optimize = true;
            } else if (arg == "-i") {
                cli_opts.run_interpreter = true;
            } else if (arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-p") {
                cli_opts.print_and_exit = true;
            } else if (arg == "-v") {
                cli_opts.debug_info = true;
            } else {
                print_error(fmt::format("unknown flag: {}", arg));
                print_usage(argv[0]);
                return 1;
            }
        } else {
            program_path = argv[i];
        }
    }
    if (program_path == nullptr) {
        print_error("file to run not specified");
        print_usage(argv[0]);
        return 1;
    }

    try {
        return run(program_path, cli_opts);
    } catch (bfvm::VMError const& e) {
        print_error(e.what());
        return 1;
    }
}

int run(char const* program_path, bfvm::CLIOpts const& cli_opts) {
    if (cli_opts.print_and_exit || cli_opts.run_interpreter) {
        auto bytecode = bfvm::compile(bfvm::load_program(program_path));
        auto const unoptimized_size = bytecode.size();
        if (cli_opts.optimize)
            bfvm::optimize(bytecode);
        if (cli_opts.debug_info)
            fmt::print(stderr, "ir: {} instructions ({} before optimization)\n", bytecode.size(), unoptimized_size);

        if (cli_opts.print_and_exit) {
            bfvm::print_ir(bytecode);
            return 0;
        }
        auto interpreter = bfvm::Interpreter( bytecode, std::cin, std::cout );
        interpreter.run_until_end();
        return 0;
    }

    auto vm = bfvm::VM::from_file( program_path, std::cin, std::cout, cli_opts.optimize );
    if (cli_opts.debug_info) {
        fmt::print(stderr, "ir: {} instructions\n", vm->ir().size());
        fmt::print(stderr, "code: {} bytes\n", vm->code_size());
        fmt::print(stderr, "tape: {} bytes\n", bfvm::kTapeSize);
    }
    vm->run();
    return 0;
}

void print_error(std::string_view msg) {
    fmt::print(stderr, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "error");
    fmt::print(stderr, ": {}\n", msg);
}

void print_usage(char const* argv) {
    fmt::print(R"(Usage:
{} [-o] [-i] [-p] [-v] SOURCE_FILE
OPTIONS:
    -o      enable optimizations
    -i      use interpreter instead of JIT
    -p      print IR and exit
    -v      print debug statistics to stderr
    -h      print this message
)", argv);
}
