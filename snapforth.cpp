/****

snapforth: A Line-at-a-Time Forth Evaluator in C++
==================================================

----

This is free and unencumbered software released into the public domain.

Anyone is free to copy, modify, publish, use, compile, sell, or distribute this
software, either in source code form or as a compiled binary, for any purpose,
commercial or non-commercial, and by any means.

In jurisdictions that recognize copyright laws, the author or authors of this
software dedicate any and all copyright interest in the software to the public
domain. We make this dedication for the benefit of the public at large and to
the detriment of our heirs and successors. We intend this dedication to be an
overt act of relinquishment in perpetuity of all present and future rights to
this software under copyright law.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  IN NO EVENT SHALL THE
AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

For more information, please refer to <http://unlicense.org/>

----

`snapforth` is a very small Forth.  It has no data space, no return stack, no
control flow and no compiler state.  What it does have is a data stack of
32-bit cells, thirteen primitive words, and a dictionary of colon definitions.

The unusual part is how colon definitions are stored.  A traditional Forth
compiles a definition into a list of execution tokens that refer to other
definitions, so redefining a word changes the behavior of every word that
calls it by name.  We do something simpler: when a definition is made, every
word in its body is resolved right away, and the bodies of any words it uses
are copied in.  A stored definition therefore contains nothing but primitives
and literals.  We call this a _snapshot_: redefining `a` after `b` has been
defined in terms of it leaves `b` exactly as it was.

The interpreter is driven one line at a time through `Machine::eval()`.  A line
that starts with `:` is a definition, and anything else is executed.  There is
no `;`; the definition ends with the line.

We are writing C++ conforming to the C++14 standard.

----

The Code
--------

We include `snapforth.h`, which declares the public types and includes the
`snapforthconfig.h` file produced by the CMake build.

****/

#include "snapforth.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

/****

snapforth can use the GNU Readline library for user input if it is available.

The CMake build will detect whether the library is available, and if so define
`SNAPFORTH_USE_READLINE`.  You can pass `-DSNAPFORTH_DISABLE_READLINE=ON` to
`cmake` to prevent it from searching for the library.

****/

#ifdef SNAPFORTH_USE_READLINE
#include "readline/readline.h"
#include "readline/history.h"
#endif

/****

The text printed after each successfully interpreted line is normally set in
`snapforthconfig.h`, but we provide a default in case it has not been.

****/

#ifndef SNAPFORTH_PROMPT
#define SNAPFORTH_PROMPT "  ok"
#endif

/****

Primitive Names
---------------

The tokenizer recognizes primitives by their exact names.  This table comes
first in the resolution order, so no colon definition can shadow one of these
names.

The second column is the name we use in error messages.

****/

namespace {

using snapforth::Cell;
using snapforth::Primitive;

struct PrimitiveWord {
    const char* name;
    const char* opName;
    Primitive   op;
};

const PrimitiveWord primitiveWords[] = {
    // name      opName       op
    // ------------------------------------------
    {".",       "dot",       Primitive::Dot},
    {"-",       "minus",     Primitive::Minus},
    {"+",       "plus",      Primitive::Plus},
    {"*",       "star",      Primitive::Star},
    {"/",       "slash",     Primitive::Slash},
    {"mod",     "mod",       Primitive::Mod},
    {"/mod",    "slash-mod", Primitive::SlashMod},
    {"emit",    "emit",      Primitive::Emit},
    {"drop",    "drop",      Primitive::Drop},
    {"dup",     "dup",       Primitive::Dup},
    {"rot",     "rot",       Primitive::Rot},
    {"spaces",  "spaces",    Primitive::Spaces},
    {"swap",    "swap",      Primitive::Swap},
};

bool findPrimitive(const std::string& name, Primitive& op) {
    for (auto& w: primitiveWords) {
        if (name == w.name) {
            op = w.op;
            return true;
        }
    }
    return false;
}

const char* opName(Primitive op) {
    for (auto& w: primitiveWords) {
        if (w.op == op)
            return w.opName;
    }
    return "?";
}

/****

Arithmetic
----------

Cells are 32-bit two's complement values.  Addition, subtraction and
multiplication wrap around on overflow, which we get by doing the operation on
unsigned values and converting back.

Division and remainder truncate toward zero, which is what C++ does.  A zero
divisor is an error, and so is `INT32_MIN / -1`, whose quotient has no
representation.

****/

using UCell = std::uint32_t;

Cell wrap(UCell u) {
    return static_cast<Cell>(u);
}

Cell wrappingAdd(Cell a, Cell b) { return wrap(static_cast<UCell>(a) + static_cast<UCell>(b)); }
Cell wrappingSub(Cell a, Cell b) { return wrap(static_cast<UCell>(a) - static_cast<UCell>(b)); }
Cell wrappingMul(Cell a, Cell b) { return wrap(static_cast<UCell>(a) * static_cast<UCell>(b)); }

void requireDivisible(Cell a, Cell b, const char* name) {
    if (b == 0)
        throw snapforth::ArithmeticError(name, "division by zero");
    if (a == std::numeric_limits<Cell>::min() && b == -1)
        throw snapforth::ArithmeticError(name, "division overflow");
}

/****

Character Output
----------------

`emit` takes a Unicode code point and appends its UTF-8 encoding to the
output.

****/

constexpr Cell MaxCodePoint = 0x10FFFF;

bool isSurrogate(Cell c) {
    return 0xD800 <= c && c <= 0xDFFF;
}

void appendUtf8(std::string& out, Cell c) {
    auto u = static_cast<UCell>(c);
    if (u < 0x80) {
        out.push_back(static_cast<char>(u));
    }
    else if (u < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (u >> 6)));
        out.push_back(static_cast<char>(0x80 | (u & 0x3F)));
    }
    else if (u < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (u >> 12)));
        out.push_back(static_cast<char>(0x80 | ((u >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (u & 0x3F)));
    }
    else {
        out.push_back(static_cast<char>(0xF0 | (u >> 18)));
        out.push_back(static_cast<char>(0x80 | ((u >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((u >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (u & 0x3F)));
    }
}

// Every output-producing word is followed by a single space.
void output(std::string& out, const std::string& text) {
    out += text;
    out += ' ';
}

std::string invalidCodePointMessage(Cell value) {
    if (value < 0)
        return "emit: out of bounds";
    std::ostringstream msg;
    msg << "emit: invalid unicode 0x" << std::hex << std::setw(2) << std::setfill('0') << value;
    return msg.str();
}

bool isWordSeparator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

} // end anonymous namespace

namespace snapforth {

bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind)
        return false;
    return a.isBuiltin() ? a.op == b.op : a.value == b.value;
}

bool operator!=(const Token& a, const Token& b) {
    return !(a == b);
}

/****

Exceptions
----------

All errors derive from `Error`, a `std::runtime_error`, so a front end can
catch them in one place and print `what()`.

****/

MalformedDefinition::MalformedDefinition()
    : Error(ErrorKind::MalformedDefinition, "no name specified for definition") {}

StackUnderflow::StackUnderflow(const std::string& name)
    : Error(ErrorKind::StackUnderflow, name + ": stack underflow"), opName(name) {}

UndefinedWord::UndefinedWord(const std::string& word)
    : Error(ErrorKind::UndefinedWord, "undefined word '" + word + "'"), wordText(word) {}

InvalidCodePoint::InvalidCodePoint(Cell value)
    : Error(ErrorKind::InvalidCodePoint, invalidCodePointMessage(value)), codePoint(value) {}

ArithmeticError::ArithmeticError(const std::string& name, const std::string& what)
    : Error(ErrorKind::Arithmetic, name + ": " + what), opName(name) {}

/****

Parsing Words
-------------

A line is split into words on ASCII whitespace.  A number is an optional `+`
or `-` followed by one or more decimal digits, and it must fit in a cell.
Anything else that looks numeric, such as `12x` or `99999999999`, is not a
number and will be looked up in the dictionary instead.

****/

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    auto i = std::size_t(0);
    auto length = text.size();
    while (i < length) {
        // Skip leading separators
        while (i < length && isWordSeparator(text[i]))
            ++i;

        auto start = i;
        while (i < length && !isWordSeparator(text[i]))
            ++i;

        if (i > start)
            words.emplace_back(text, start, i - start);
    }
    return words;
}

bool parseNumber(const std::string& text, Cell& result) {
    auto i = std::size_t(0);
    auto negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = (text[0] == '-');
        ++i;
    }
    if (i == text.size())
        return false;

    // One past the largest magnitude allowed for either sign.
    const std::int64_t limit = negative
        ? -static_cast<std::int64_t>(std::numeric_limits<Cell>::min())
        : static_cast<std::int64_t>(std::numeric_limits<Cell>::max());

    std::int64_t value = 0;
    for (; i < text.size(); ++i) {
        auto c = text[i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
        if (value > limit)
            return false;
    }

    result = static_cast<Cell>(negative ? -value : value);
    return true;
}

/****

Machine
-------

The constructor seeds the dictionary with a few words that are written in
terms of the primitives.  They go through the normal definition path, so they
are ordinary entries and may be redefined.

`over` is `swap dup rot swap`: with `x1 x2` on the stack, `swap dup` gives
`x2 x1 x1`, `rot` brings `x2` to the top, and `swap` puts `x1` back on top.

****/

Machine::Machine() {
    defineBuiltins();
}

void Machine::defineBuiltins() {
    static const char* lines[] = {
        ": space  32 emit",
        ": cr     13 emit 10 emit",
        ": over   swap dup rot swap",
    };
    for (auto line: lines) {
        eval(line);
    }
}

void Machine::reset() {
    dStack.clear();
    definitions.clear();
    defineBuiltins();
}

const Tokens* Machine::findDefinition(const std::string& name) const {
    auto i = definitions.find(name);
    return i == definitions.end() ? nullptr : &i->second;
}

std::string Machine::eval(const std::string& line) {
    if (!line.empty() && line[0] == ':') {
        evalDefinition(line.substr(1));
        return std::string();
    }
    return evalExpression(line);
}

/****

Tokenizer
---------

Each word is resolved in this order:

1. a primitive name,
2. a number,
3. a dictionary entry, whose tokens are copied in,

and anything left over is an undefined word.

****/

Tokens Machine::tokenize(const std::vector<std::string>& words) const {
    Tokens tokens;
    for (auto& word: words) {
        Primitive op;
        Cell n;
        if (findPrimitive(word, op)) {
            tokens.push_back(Token::builtin(op));
        }
        else if (parseNumber(word, n)) {
            tokens.push_back(Token::number(n));
        }
        else {
            auto defn = findDefinition(word);
            if (defn == nullptr)
                throw UndefinedWord(word);
            tokens.insert(tokens.end(), defn->begin(), defn->end());
        }
    }
    return tokens;
}

/****

Definitions
-----------

`: name body...` resolves the body now and replaces any existing entry for
`name`.  If the body does not resolve, the dictionary is left alone.

****/

void Machine::evalDefinition(const std::string& text) {
    auto words = splitWords(text);
    if (words.empty())
        throw MalformedDefinition();

    auto name = words.front();
    words.erase(words.begin());

    auto body = tokenize(words);
    definitions[name] = std::move(body);
}

/****

Inner Interpreter
-----------------

An expression is tokenized as a whole before anything runs, so an undefined
word anywhere on the line means nothing on the line is executed.  Once tokens
start executing there is no rollback: if a word fails, whatever the earlier
tokens did to the stack stays done, and so do any pops the failing word had
already made.

****/

std::string Machine::evalExpression(const std::string& text) {
    auto tokens = tokenize(splitWords(text));

    std::string out;
    for (auto& token: tokens) {
        execute(token, out);
    }
    return out;
}

Cell Machine::pop(const char* name) {
    if (dStack.empty())
        throw StackUnderflow(name);
    auto x = dStack.back();
    dStack.pop_back();
    return x;
}

Cell Machine::top(const char* name) const {
    if (dStack.empty())
        throw StackUnderflow(name);
    return dStack.back();
}

void Machine::execute(const Token& token, std::string& out) {
    if (token.isNumber()) {
        push(token.value);
        return;
    }

    auto name = opName(token.op);

    switch (token.op) {

    // . ( n -- )
    case Primitive::Dot:
        output(out, std::to_string(pop(name)));
        break;

    // drop ( x -- )
    case Primitive::Drop:
        pop(name);
        break;

    // dup ( x -- x x )
    case Primitive::Dup:
        push(top(name));
        break;

    // + ( n1 n2 -- n3 )
    case Primitive::Plus: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        push(wrappingAdd(n1, n2));
        break;
    }

    // - ( n1 n2 -- n3 )
    case Primitive::Minus: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        push(wrappingSub(n1, n2));
        break;
    }

    // * ( n1 n2 -- n3 )
    case Primitive::Star: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        push(wrappingMul(n1, n2));
        break;
    }

    // / ( n1 n2 -- n3 )
    case Primitive::Slash: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        requireDivisible(n1, n2, name);
        push(n1 / n2);
        break;
    }

    // mod ( n1 n2 -- n3 )
    case Primitive::Mod: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        requireDivisible(n1, n2, name);
        push(n1 % n2);
        break;
    }

    // /mod ( n1 n2 -- rem quot )
    case Primitive::SlashMod: {
        auto n2 = pop(name);
        auto n1 = pop(name);
        requireDivisible(n1, n2, name);
        push(n1 % n2);
        push(n1 / n2);
        break;
    }

    // rot ( x1 x2 x3 -- x2 x3 x1 )
    case Primitive::Rot: {
        if (dStack.size() < 3)
            throw StackUnderflow(name);
        auto third = dStack.end() - 3;
        auto x = *third;
        dStack.erase(third);
        push(x);
        break;
    }

    // swap ( x1 x2 -- x2 x1 )
    case Primitive::Swap: {
        auto x2 = pop(name);
        auto x1 = pop(name);
        push(x2);
        push(x1);
        break;
    }

    // emit ( char -- )
    case Primitive::Emit: {
        auto c = pop(name);
        if (c < 0 || c > MaxCodePoint || isSurrogate(c))
            throw InvalidCodePoint(c);
        std::string ch;
        appendUtf8(ch, c);
        output(out, ch);
        break;
    }

    // spaces ( n -- )
    // A negative count prints no spaces.
    case Primitive::Spaces: {
        auto n = pop(name);
        output(out, std::string(n > 0 ? static_cast<std::size_t>(n) : 0, ' '));
        break;
    }
    }
}

} // namespace snapforth

/****

Outer Interpreter
-----------------

Everything below is the interactive front end.  It is not part of the
`Machine`; it just reads lines, hands them to `eval()`, and prints what comes
back.

`refill()` reads a line from the user input device.  We use GNU Readline if
configured to do so.  Otherwise we use the C++ `std::getline()` function.

****/

namespace {

bool refill(std::string& line) {
#ifdef SNAPFORTH_USE_READLINE
    char* input = readline("");
    if (!input)
        return false;
    line = input;
    if (*input)
        add_history(input);
    std::free(input);
    return true;
#else
    return static_cast<bool>(std::getline(std::cin, line));
#endif
}

void prompt() {
    std::cout << SNAPFORTH_PROMPT << std::endl;
}

/****

`quit()` is the top-level loop.  An error is reported and the loop carries on
with the same `Machine`; unlike a traditional Forth `QUIT`, we do not clear the
data stack.

****/

void quit(snapforth::Machine& machine) {
    std::string line;
    while (refill(line)) {
        try {
            std::cout << machine.eval(line);
        }
        catch (const snapforth::Error& err) {
            std::cout << "<<< Error: " << err.what() << " >>>" << std::endl;
        }
        prompt();
    }
    std::cout << std::endl;
}

} // end anonymous namespace

const char* snapforthVersion = "1.0.0";

extern "C" int snapforthRun(int, const char**) {
    try {
        snapforth::Machine machine;
        quit(machine);
        return 0;
    }
    catch (const std::exception& ex) {
        std::cerr << "snapforth: " << ex.what() << std::endl;
        return -1;
    }
}

/****

Finally we have our `main()`. If there are no command-line arguments, it prints
a banner. Then it calls `snapforthRun()`.

You can define the macro `SNAPFORTH_NO_MAIN` to inhibit generation of `main()`.
The CMake build does this for the library that the tests link against.

****/

#ifndef SNAPFORTH_NO_MAIN

int main(int argc, const char** argv) {
    if (argc == 1) {
        std::cout << "snapforth "
                  << snapforthVersion
                  << "\nPress Ctrl-D to exit." << std::endl;
    }

    return snapforthRun(argc, argv);
}

#endif // SNAPFORTH_NO_MAIN
