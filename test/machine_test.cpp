#include "snapforth.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using snapforth::Cell;
using snapforth::Machine;

namespace {

std::vector<Cell> stackAfter(const std::string& line) {
    Machine m;
    m.eval(line);
    return m.stack();
}

template<typename E>
std::string messageOf(Machine& m, const std::string& line) {
    try {
        m.eval(line);
    }
    catch (const E& err) {
        return err.what();
    }
    return "<no error>";
}

} // end anonymous namespace

TEST(ArithmeticTest, BinaryOperators) {
    EXPECT_EQ(std::vector<Cell>{5}, stackAfter("2 3 +"));
    EXPECT_EQ(std::vector<Cell>{-1}, stackAfter("2 3 -"));
    EXPECT_EQ(std::vector<Cell>{6}, stackAfter("2 3 *"));
    EXPECT_EQ(std::vector<Cell>{3}, stackAfter("10 3 /"));
    EXPECT_EQ(std::vector<Cell>{1}, stackAfter("10 3 mod"));
}

TEST(ArithmeticTest, DivisionTruncatesTowardZero) {
    EXPECT_EQ(std::vector<Cell>{-3}, stackAfter("-7 2 /"));
    EXPECT_EQ(std::vector<Cell>{-1}, stackAfter("-7 2 mod"));
    EXPECT_EQ(std::vector<Cell>{1}, stackAfter("7 -2 mod"));
}

TEST(ArithmeticTest, SlashModLeavesRemainderBelowQuotient) {
    EXPECT_EQ((std::vector<Cell>{1, 3}), stackAfter("7 2 /mod"));
    EXPECT_EQ((std::vector<Cell>{-1, -3}), stackAfter("-7 2 /mod"));
}

TEST(ArithmeticTest, OverflowWraps) {
    EXPECT_EQ(std::vector<Cell>{-2147483647 - 1}, stackAfter("2147483647 1 +"));
    EXPECT_EQ(std::vector<Cell>{2147483647}, stackAfter("-2147483648 1 -"));
    EXPECT_EQ(std::vector<Cell>{-2}, stackAfter("2147483647 2 *"));
}

TEST(ArithmeticTest, DivisionByZeroFails) {
    Machine m;
    EXPECT_THROW(m.eval("1 0 /"), snapforth::ArithmeticError);
    EXPECT_TRUE(m.stack().empty());

    EXPECT_EQ("mod: division by zero", messageOf<snapforth::ArithmeticError>(m, "1 0 mod"));
    EXPECT_EQ("slash-mod: division by zero", messageOf<snapforth::ArithmeticError>(m, "1 0 /mod"));
    EXPECT_TRUE(m.stack().empty());
}

TEST(ArithmeticTest, UnrepresentableQuotientFails) {
    Machine m;
    EXPECT_EQ("slash: division overflow",
              messageOf<snapforth::ArithmeticError>(m, "-2147483648 -1 /"));
    EXPECT_THROW(m.eval("-2147483648 -1 mod"), snapforth::ArithmeticError);
}

TEST(StackTest, Dup) {
    EXPECT_EQ((std::vector<Cell>{5, 5}), stackAfter("5 dup"));
}

TEST(StackTest, Drop) {
    EXPECT_EQ(std::vector<Cell>{1}, stackAfter("1 2 drop"));
}

TEST(StackTest, Swap) {
    EXPECT_EQ((std::vector<Cell>{2, 1}), stackAfter("1 2 swap"));
}

TEST(StackTest, Rot) {
    EXPECT_EQ((std::vector<Cell>{2, 3, 1}), stackAfter("1 2 3 rot"));
    EXPECT_EQ((std::vector<Cell>{9, 2, 3, 1}), stackAfter("9 1 2 3 rot"));
}

TEST(StackTest, Over) {
    EXPECT_EQ((std::vector<Cell>{1, 2, 1}), stackAfter("1 2 over"));
}

TEST(StackTest, StackPersistsBetweenLines) {
    Machine m;
    m.eval("1 2");
    m.eval("3");
    EXPECT_EQ("3 2 1 ", m.eval(". . ."));
    EXPECT_TRUE(m.stack().empty());
}

TEST(StackTest, UnderflowNamesTheOperation) {
    Machine m;
    try {
        m.eval("dup");
        FAIL() << "expected StackUnderflow";
    }
    catch (const snapforth::StackUnderflow& err) {
        EXPECT_EQ("dup", err.operation());
        EXPECT_EQ(std::string("dup: stack underflow"), err.what());
        EXPECT_TRUE(err.kind() == snapforth::ErrorKind::StackUnderflow);
    }

    EXPECT_EQ("dot: stack underflow", messageOf<snapforth::StackUnderflow>(m, "."));
    EXPECT_EQ("rot: stack underflow", messageOf<snapforth::StackUnderflow>(m, "1 2 rot"));
    EXPECT_EQ("swap: stack underflow", messageOf<snapforth::StackUnderflow>(m, "swap"));
    EXPECT_EQ("emit: stack underflow", messageOf<snapforth::StackUnderflow>(m, "emit"));
}

TEST(StackTest, RotUnderflowLeavesStackAlone) {
    Machine m;
    EXPECT_THROW(m.eval("1 2 rot"), snapforth::StackUnderflow);
    EXPECT_EQ((std::vector<Cell>{1, 2}), m.stack());
}

TEST(StackTest, FailureKeepsEarlierMutations) {
    Machine m;
    EXPECT_THROW(m.eval("1 2 3 + . drop drop"), snapforth::StackUnderflow);
    EXPECT_TRUE(m.stack().empty());

    m.eval("4");
    EXPECT_THROW(m.eval("5 6 7 0 /"), snapforth::ArithmeticError);
    EXPECT_EQ((std::vector<Cell>{4, 5, 6}), m.stack());
}

TEST(StackTest, FailingBinaryOperatorConsumesItsFirstOperand) {
    Machine m;
    EXPECT_THROW(m.eval("5 +"), snapforth::StackUnderflow);
    EXPECT_TRUE(m.stack().empty());
}

TEST(OutputTest, DotAppendsTrailingSpace) {
    Machine m;
    EXPECT_EQ("42 ", m.eval("42 ."));
    EXPECT_EQ("-7 ", m.eval("-7 ."));
    EXPECT_EQ("1 2 ", m.eval("2 1 . ."));
}

TEST(OutputTest, NoOutputIsEmptyString) {
    Machine m;
    EXPECT_EQ("", m.eval("1 2 +"));
    EXPECT_EQ("", m.eval(""));
    EXPECT_EQ("", m.eval("   "));
}

TEST(OutputTest, Emit) {
    Machine m;
    EXPECT_EQ("* ", m.eval("42 emit"));
    EXPECT_EQ("\xC3\xA9 ", m.eval("233 emit"));
    EXPECT_EQ("\xE2\x82\xAC ", m.eval("8364 emit"));
    EXPECT_EQ("\xF0\x9F\x98\x80 ", m.eval("128512 emit"));
    EXPECT_TRUE(m.stack().empty());
}

TEST(OutputTest, EmitRejectsInvalidCodePoints) {
    Machine m;
    try {
        m.eval("55296 emit");
        FAIL() << "expected InvalidCodePoint";
    }
    catch (const snapforth::InvalidCodePoint& err) {
        EXPECT_EQ(55296, err.value());
        EXPECT_EQ(std::string("emit: invalid unicode 0xd800"), err.what());
    }
    EXPECT_EQ("emit: invalid unicode 0x110000",
              messageOf<snapforth::InvalidCodePoint>(m, "1114112 emit"));
    EXPECT_EQ("emit: out of bounds", messageOf<snapforth::InvalidCodePoint>(m, "-1 emit"));
    EXPECT_TRUE(m.stack().empty());
}

TEST(OutputTest, Spaces) {
    Machine m;
    EXPECT_EQ("    ", m.eval("3 spaces"));
    EXPECT_EQ(" ", m.eval("0 spaces"));
}

TEST(OutputTest, NegativeSpacesPrintsNothing) {
    Machine m;
    EXPECT_EQ(" ", m.eval("-5 spaces"));
    EXPECT_TRUE(m.stack().empty());
}

TEST(OutputTest, SpaceAndCr) {
    Machine m;
    EXPECT_EQ("  ", m.eval("space"));
    EXPECT_EQ("\r \n ", m.eval("cr"));
    EXPECT_EQ("1 \r \n 2 ", m.eval("1 . cr 2 ."));
}

TEST(MachineTest, ResetRestoresInitialState) {
    Machine m;
    m.eval("1 2 3");
    m.eval(": space 99");
    m.eval(": extra 1");
    m.reset();

    EXPECT_TRUE(m.stack().empty());
    EXPECT_EQ(nullptr, m.findDefinition("extra"));
    EXPECT_EQ("  ", m.eval("space"));
}
