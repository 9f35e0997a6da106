#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "helpers.hpp"

using namespace bfvm;

static void test_move_left_of_tape() {
    for (bool optimize : { false, true }) {
        for (auto const* program : { "<", "+.<", ">><<<", "+[<]" }) {
            auto ret = run_jit(program, optimize);
            assert(!ret.ok);
            assert(ret.kind == RuntimeError::Kind::PointerOverflow);
        }
    }
}

static void test_move_right_of_tape() {
    for (bool optimize : { false, true }) {
        for (auto const* program : { "+[>+]", "+[>>>>>>>>>>>>>>>>>>+]", "+[>+>-<]" }) {
            auto ret = run_jit(program, optimize);
            assert(!ret.ok);
            assert(ret.kind == RuntimeError::Kind::PointerOverflow);
        }
    }
}

static void test_output_before_fault_is_kept() {
    auto ret = run_jit("+++.<.", false);
    assert(!ret.ok);
    assert(ret.output == "\x03");
}

static void test_overflow_message() {
    std::istringstream in;
    std::ostringstream out;
    VM vm("<", in, out, false);
    try {
        vm.run();
        assert(false);
    } catch (VMError const& e) {
        assert(std::string(e.what()) == "Runtime: Pointer overflow");
    }
}

static void test_write_failure() {
    BrokenBuf buf;
    std::istringstream in;
    std::ostream out(&buf);
    VM vm("+.+.", in, out, false);
    try {
        vm.run();
        assert(false);
    } catch (RuntimeError const& e) {
        assert(e.kind() == RuntimeError::Kind::IO);
        assert(std::string(e.what()).starts_with("Runtime: IO: "));
    }
    // the fault stopped the program right at the first write
    assert(vm.tape()[0] == 1);
}

static void test_read_failure() {
    std::istringstream in("x");
    in.setstate(std::ios::badbit);
    std::ostringstream out;
    VM vm(",+", in, out, true);
    try {
        vm.run();
        assert(false);
    } catch (RuntimeError const& e) {
        assert(e.kind() == RuntimeError::Kind::IO);
    }
    assert(vm.tape()[0] == 0);
}

static void test_malformed_ir_rejected() {
    HostCallbacks const callbacks{ .getbyte = nullptr, .putbyte = nullptr, .overflow = nullptr };
    for (auto const& code : { std::vector<IR>{ Jnz }, std::vector<IR>{ Jz, Jz, Jnz } }) {
        try {
            JIT jit(code, callbacks);
            assert(false);
        } catch (GenerationError const&) {
        }
        std::istringstream in;
        std::ostringstream out;
        try {
            Interpreter interp(code, in, out);
            assert(false);
        } catch (VMError const&) {
        }
    }
}

static void test_compile_error_stops_construction() {
    std::istringstream in;
    std::ostringstream out;
    try {
        VM vm("+.]", in, out, true);
        assert(false);
    } catch (CompileError const& e) {
        assert(e.kind() == CompileError::Kind::UnexpectedRightBracket);
    }
    assert(out.str().empty());
}

static void test_from_file() {
    auto const path = std::filesystem::temp_directory_path() / "bfvm_test_program.bf";
    {
        std::ofstream f(path);
        f << "read one byte\n,+.";
    }
    std::istringstream in("A");
    std::ostringstream out;
    auto vm = VM::from_file(path, in, out, true);
    vm->run();
    assert(out.str() == "B");
    std::filesystem::remove(path);

    try {
        (void)VM::from_file(path, in, out, true);
        assert(false);
    } catch (VMError const& e) {
        assert(std::string(e.what()).starts_with("IO: "));
    }
}

int main() {
    test_move_left_of_tape();
    test_move_right_of_tape();
    test_output_before_fault_is_kept();
    test_overflow_message();
    test_write_failure();
    test_read_failure();
    test_malformed_ir_rejected();
    test_compile_error_stops_construction();
    test_from_file();
    return 0;
}
