#ifndef snapforth_h_included
#define snapforth_h_included

#include "snapforthconfig.h"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

extern const char* snapforthVersion;

namespace snapforth {

using Cell = std::int32_t;

// The closed set of primitive operations.  Adding one means extending this
// enumeration, the name table in snapforth.cpp, and Machine::execute().
enum class Primitive {
    Dot,
    Drop,
    Dup,
    Emit,
    Minus,
    Mod,
    Plus,
    Rot,
    Slash,
    SlashMod,
    Spaces,
    Star,
    Swap,
};

struct Token {
    enum class Kind { Builtin, Number };

    Kind      kind  = Kind::Number;
    Primitive op    = Primitive::Dot;
    Cell      value = 0;

    static Token builtin(Primitive op) {
        Token t;
        t.kind = Kind::Builtin;
        t.op = op;
        return t;
    }

    static Token number(Cell n) {
        Token t;
        t.kind = Kind::Number;
        t.value = n;
        return t;
    }

    bool isBuiltin() const { return kind == Kind::Builtin; }
    bool isNumber() const  { return kind == Kind::Number; }
};

bool operator==(const Token& a, const Token& b);
bool operator!=(const Token& a, const Token& b);

using Tokens = std::vector<Token>;

/****

Errors

Every failure of Machine::eval() is thrown as a subclass of Error.  The
Machine survives any of them; the stack keeps whatever mutations happened
before the failing token.

****/

enum class ErrorKind {
    MalformedDefinition,
    StackUnderflow,
    UndefinedWord,
    InvalidCodePoint,
    Arithmetic,
};

class Error: public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg): std::runtime_error(msg), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

class MalformedDefinition: public Error {
public:
    MalformedDefinition();
};

class StackUnderflow: public Error {
public:
    explicit StackUnderflow(const std::string& opName);

    const std::string& operation() const { return opName; }

private:
    std::string opName;
};

class UndefinedWord: public Error {
public:
    explicit UndefinedWord(const std::string& word);

    const std::string& word() const { return wordText; }

private:
    std::string wordText;
};

// Thrown by emit.  value() is the popped cell.
class InvalidCodePoint: public Error {
public:
    explicit InvalidCodePoint(Cell value);

    Cell value() const { return codePoint; }

private:
    Cell codePoint;
};

// Division or remainder by zero, or a quotient that does not fit in a Cell.
class ArithmeticError: public Error {
public:
    ArithmeticError(const std::string& opName, const std::string& what);

    const std::string& operation() const { return opName; }

private:
    std::string opName;
};

/****

Machine

A Machine owns one dictionary and one data stack.  It is not thread safe; a
caller that shares one between threads must serialize calls to eval().

****/

class Machine {
public:
    Machine();

    // Evaluate one line.  A line starting with ':' defines a word and returns
    // an empty string; any other line is executed and its output returned.
    std::string eval(const std::string& line);

    // Resolve words to tokens against the current dictionary.
    Tokens tokenize(const std::vector<std::string>& words) const;

    // Stored expansion of a word, or nullptr if it is not defined.
    const Tokens* findDefinition(const std::string& name) const;

    // Stack contents, bottom first.
    const std::vector<Cell>& stack() const { return dStack; }

    // Clear the stack and restore the bootstrap dictionary.
    void reset();

private:
    void evalDefinition(const std::string& text);
    std::string evalExpression(const std::string& text);
    void execute(const Token& token, std::string& output);
    void defineBuiltins();

    Cell pop(const char* name);
    Cell top(const char* name) const;
    void push(Cell x) { dStack.push_back(x); }

    std::map<std::string, Tokens> definitions;
    std::vector<Cell> dStack;
};

// Split text on ASCII whitespace (space, tab, line feed, form feed, carriage return).
std::vector<std::string> splitWords(const std::string& text);

// Parse a signed decimal literal that fits in a Cell.
bool parseNumber(const std::string& text, Cell& result);

} // namespace snapforth

#ifdef __cplusplus
extern "C" {
#endif

int snapforthRun(int argc, const char** argv);

#ifdef __cplusplus
}
#endif

#endif // snapforth_h_included
