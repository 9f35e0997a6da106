#include <sstream>
#include <string>

#include "helpers.hpp"

using namespace bfvm;

static void test_hello_world() {
    for (bool optimize : { false, true }) {
        auto ret = run_jit(kHelloWorld, optimize);
        assert(ret.ok);
        assert(ret.output == "Hello World!\n");
    }
}

static void test_echo() {
    auto ret = run_jit(",[.,]", true, "abc");
    assert(ret.ok);
    assert(ret.output == "abc");
}

static void test_loops() {
    std::istringstream in;
    std::ostringstream out;
    VM vm("++[>++<-]", in, out, false);
    vm.run();
    assert(vm.tape()[0] == 0);
    assert(vm.tape()[1] == 4);
}

static void test_wrapping() {
    std::istringstream in;
    std::ostringstream out;
    auto const program = "->+++[>" + std::string(86, '+') + "<-]";
    VM vm(program, in, out, true);
    vm.run();
    assert(vm.tape()[0] == 255);
    // 3 * 86 = 258
    assert(vm.tape()[2] == 2);
}

static void test_eof_leaves_cell() {
    {
        std::istringstream in("");
        std::ostringstream out;
        VM vm(",", in, out, false);
        vm.run();
        assert(vm.tape()[0] == 0);
    }
    {
        std::istringstream in("");
        std::ostringstream out;
        VM vm("+++++,.", in, out, true);
        vm.run();
        assert(vm.tape()[0] == 5);
        assert(out.str() == "\x05");
    }
    {
        std::istringstream in("A");
        std::ostringstream out;
        VM vm(",,", in, out, false);
        vm.run();
        assert(vm.tape()[0] == 'A');
    }
}

static void test_rerun_starts_fresh() {
    std::istringstream in;
    std::ostringstream out;
    VM vm("+++.", in, out, false);
    vm.run();
    vm.run();
    assert(out.str() == "\x03\x03");
    assert(vm.tape()[0] == 3);
}

static void test_tape_edges() {
    // walking to the last cell is fine, one more step is not
    auto ret = run_jit("+[>+]", true);
    assert(!ret.ok);
    assert(ret.kind == RuntimeError::Kind::PointerOverflow);

    std::istringstream in;
    std::ostringstream out;
    VM vm("+[>+]", in, out, false);
    try {
        vm.run();
        assert(false);
    } catch (RuntimeError const&) {
    }
    for (auto cell : vm.tape())
        assert(cell == 1);
}

int main() {
    test_hello_world();
    test_echo();
    test_loops();
    test_wrapping();
    test_eof_leaves_cell();
    test_rerun_starts_fresh();
    test_tape_edges();
    return 0;
}
