#include "stack_machine.hpp"
#include "assembler.hpp"
#include "binary.hpp"
#include "config.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace spvm;

namespace {

// Ensambla y ejecuta con salida/entrada en memoria.
struct VmRun {
  std::ostringstream out;
  std::istringstream in;
  Assembly asm_;
  StackMachine vm;

  explicit VmRun(const std::string& src, bool verbose = false, const std::string& input = "")
    : in(input), asm_(Assembler::assemble_from_string(src)),
      vm(with_verbose(asm_.debug, verbose), out, in) {}

  int run() { return vm.run(asm_.program); }

  // Ejecuta esperando una falla.
  ExecutionFault fault() {
    try {
      vm.run(asm_.program);
    } catch (const ExecutionFault& e) {
      return e;
    }
    ADD_FAILURE() << "se esperaba ExecutionFault";
    return ExecutionFault(0, "", "");
  }

  static DebugInfo with_verbose(DebugInfo d, bool v) {
    d.set_verbose(v);
    return d;
  }
};

} // namespace

TEST(StackMachine, SquaresASum) {
  VmRun r("PUSH 4\nPUSH 5\nADD\nDUP\nMUL\nPRINTOUT\nEXIT\n");
  EXPECT_EQ(r.run(), 0);
  EXPECT_EQ(r.out.str(), "81\n");
  EXPECT_EQ(r.vm.state(), MachineState::Halted);
}

TEST(StackMachine, PopOnEmptyStackFaults) {
  VmRun r("POP\nEXIT\n");
  auto f = r.fault();
  EXPECT_EQ(f.addr(), 0u);
  EXPECT_EQ(f.mnemonic(), "POP");
  EXPECT_EQ(r.vm.state(), MachineState::Faulted);
  EXPECT_EQ(r.vm.exit_code(), cfg::kFaultExitCode);
}

TEST(StackMachine, UnderflowMessageNamesMnemonicOnce) {
  VmRun r("POP\nEXIT\n");
  const std::string msg = r.fault().what();
  EXPECT_EQ(msg, "Panic: (@0000) POP: no hay suficientes valores en la pila");
}

TEST(StackMachine, EveryPoppingInstructionFaultsOnUnderflow) {
  struct Case {
    const char* src;
    const char* mnemonic;
    Addr        addr;
  };
  const Case cases[] = {
    {"DUP\n",             "DUP",      0},
    {"PUSH 1\nSWAP\n",    "SWAP",     1},
    {"PUSH 1\nADD\n",     "ADD",      1},
    {"PUSH 1\nSUB\n",     "SUB",      1},
    {"PUSH 1\nMUL\n",     "MUL",      1},
    {"PUSH 1\nDIV\n",     "DIV",      1},
    {"PUSH 0\nJZ\n",      "JZ",       1},
    {"PUSH 0\nJNZ\n",     "JNZ",      1},
    {"JMP\n",             "JMP",      0},
    {"CALL\n",            "CALL",     0},
    {"PRINTOUT\n",        "PRINTOUT", 0},
    {"PRINTSTR\n",        "PRINTSTR", 0},
  };

  for (const auto& c : cases) {
    SCOPED_TRACE(c.src);
    VmRun r(c.src);
    auto f = r.fault();
    EXPECT_EQ(f.mnemonic(), c.mnemonic);
    EXPECT_EQ(f.addr(), c.addr);
    EXPECT_EQ(f.cause(), "no hay suficientes valores en la pila");
    EXPECT_EQ(r.vm.state(), MachineState::Faulted);
    EXPECT_EQ(r.vm.exit_code(), cfg::kFaultExitCode);
  }
}

TEST(StackMachine, ForwardJumpSkipsPrintout) {
  VmRun r("PUSH end\nJMP\nPUSH 99\nPRINTOUT\nend:\nEXIT\n");
  ASSERT_EQ(r.asm_.program.code[0].arg, 4);
  EXPECT_EQ(r.run(), 0);
  EXPECT_EQ(r.out.str(), "");
}

TEST(StackMachine, PushStrThenPrintstrConsumesTerminator) {
  VmRun r("@PushStr \"hi\"\nPRINTSTR\nEXIT\n");
  // Se ejecutan los 3 PUSH y PRINTSTR a mano para mirar la pila antes de EXIT
  for (int i = 0; i < 4; ++i) r.vm.step(r.asm_.program);
  EXPECT_EQ(r.out.str(), "hi");
  EXPECT_TRUE(r.vm.stack().empty());
  EXPECT_EQ(r.vm.ip(), 4u);
}

TEST(StackMachine, CallPushesReturnAddressForJmp) {
  VmRun r(
    "PUSH func\n"   // 0
    "CALL\n"        // 1
    "PUSH 7\n"      // 2 <- retorno
    "PRINTOUT\n"    // 3
    "EXIT\n"        // 4
    "func:\n"
    "PUSH 42\n"     // 5
    "PRINTOUT\n"    // 6
    "JMP\n");       // 7
  EXPECT_EQ(r.run(), 0);
  EXPECT_EQ(r.out.str(), "42\n7\n");
}

TEST(StackMachine, DivisionByZeroFaults) {
  VmRun r("PUSH 0\nPUSH 10\nDIV\nEXIT\n");
  auto f = r.fault();
  EXPECT_EQ(f.addr(), 2u);
  EXPECT_EQ(f.mnemonic(), "DIV");
  EXPECT_EQ(r.vm.exit_code(), cfg::kFaultExitCode);
}

TEST(StackMachine, OperandOrderIsTopFirst) {
  VmRun sub("PUSH 3\nPUSH 10\nSUB\nPRINTOUT\nPUSH 2\nPUSH 10\nDIV\nPRINTOUT\nEXIT\n");
  sub.run();
  EXPECT_EQ(sub.out.str(), "7\n5\n");
}

TEST(StackMachine, SwapExchangesTopTwo) {
  VmRun r("PUSH 1\nPUSH 2\nSWAP\nPRINTOUT\nPRINTOUT\nEXIT\n");
  r.run();
  EXPECT_EQ(r.out.str(), "1\n2\n");
}

TEST(StackMachine, ArithmeticWrapsOnOverflow) {
  VmRun r("PUSH 0x7FFFFFFFFFFFFFFF\nPUSH 1\nADD\nPRINTOUT\nEXIT\n");
  r.run();
  EXPECT_EQ(r.out.str(), "-9223372036854775808\n");

  VmRun d("PUSH -1\nPUSH 0x8000000000000000\nDIV\nEXIT\n");
  EXPECT_EQ(d.fault().mnemonic(), "DIV");
}

TEST(StackMachine, JnzLoopCountsDown) {
  VmRun r(
    "PUSH 3\n"
    "loop:\n"
    "DUP\nPRINTOUT\n"
    "PUSH -1\nADD\n"
    "DUP\nPUSH loop\nJNZ\n"
    "EXIT\n");
  EXPECT_EQ(r.run(), 0);
  EXPECT_EQ(r.out.str(), "3\n2\n1\n");
}

TEST(StackMachine, JzJumpsOnlyOnZero) {
  VmRun taken("PUSH 0\nPUSH skip\nJZ\nPUSH 1\nPRINTOUT\nskip:\nPUSH 5\nEXIT\n");
  EXPECT_EQ(taken.run(), 5);
  EXPECT_EQ(taken.out.str(), "");

  VmRun not_taken("PUSH 1\nPUSH skip\nJZ\nPUSH 1\nPRINTOUT\nskip:\nPUSH 5\nEXIT\n");
  EXPECT_EQ(not_taken.run(), 5);
  EXPECT_EQ(not_taken.out.str(), "1\n");
}

TEST(StackMachine, ExitDefaultsToZeroOnEmptyStack) {
  VmRun r("EXIT\n");
  EXPECT_EQ(r.run(), 0);
  VmRun c("PUSH 3\nEXIT\nPOP\n");
  EXPECT_EQ(c.run(), 3);
}

TEST(StackMachine, RunningOffTheEndFaults) {
  VmRun r("PUSH 1\n");
  auto f = r.fault();
  EXPECT_EQ(f.addr(), 1u);
  EXPECT_TRUE(f.mnemonic().empty());
  EXPECT_EQ(r.vm.state(), MachineState::Faulted);
}

TEST(StackMachine, NegativeJumpTargetFaults) {
  VmRun r("PUSH -1\nJMP\n");
  EXPECT_EQ(r.fault().mnemonic(), "JMP");
}

TEST(StackMachine, PrintstrWithoutTerminatorFaults) {
  VmRun r("PUSH 104\nPRINTSTR\nEXIT\n");
  auto f = r.fault();
  EXPECT_EQ(f.addr(), 1u);
  EXPECT_EQ(f.mnemonic(), "PRINTSTR");
  EXPECT_EQ(r.out.str(), "h");
}

TEST(StackMachine, BreakpointsAreIgnoredWhenNotVerbose) {
  VmRun r("PUSH 1\n@Break\nPRINTOUT\nEXIT\n", /*verbose=*/false, "n\n");
  EXPECT_EQ(r.run(), 0);
  EXPECT_EQ(r.out.str(), "1\n");
}

TEST(StackMachine, BreakpointContinuesOnYes) {
  VmRun r("PUSH 1\n@Break\nPRINTOUT\nEXIT\n", /*verbose=*/true, "y\n");
  EXPECT_EQ(r.run(), 0);
  const auto out = r.out.str();
  EXPECT_NE(out.find("BREAKPOINT @0001"), std::string::npos);
  EXPECT_NE(out.find("0001 >> PRINTOUT"), std::string::npos);
  EXPECT_NE(out.find("[y/n] > 1\n"), std::string::npos);
}

TEST(StackMachine, BreakpointAbortsOnNo) {
  VmRun r("PUSH 1\n@Break\nPRINTOUT\nEXIT\n", /*verbose=*/true, "  No \n");
  auto f = r.fault();
  EXPECT_EQ(f.addr(), 1u);
  EXPECT_EQ(f.mnemonic(), "PRINTOUT");
  EXPECT_EQ(r.vm.exit_code(), cfg::kFaultExitCode);
}

TEST(StackMachine, BreakpointAbortsWhenInputIsClosed) {
  VmRun r("@Break\nEXIT\n", /*verbose=*/true, "");
  EXPECT_EQ(r.fault().addr(), 0u);
}

TEST(StackMachine, RunsProgramLoadedFromBinary) {
  auto src = Assembler::assemble_from_string(
    "PUSH 4\nPUSH 5\nADD\nDUP\nMUL\nPRINTOUT\n@PushStr \"ok\"\nPRINTSTR\nEXIT\n");
  std::stringstream ss;
  Binary::save(src.program, ss);
  auto loaded = Binary::load(ss);

  std::ostringstream out;
  std::istringstream in;
  StackMachine vm(DebugInfo{}, out, in);
  EXPECT_EQ(vm.run(loaded), 0);
  EXPECT_EQ(out.str(), "81\nok");
}

TEST(StackMachine, RunResetsState) {
  VmRun r("PUSH 2\nEXIT\n");
  EXPECT_EQ(r.run(), 2);
  EXPECT_EQ(r.run(), 2);
  EXPECT_EQ(r.vm.ip(), 2u);
}
