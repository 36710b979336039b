#pragma once

// Python front end: the embedded interpreter's own `ast` module parses the
// submission, and the resulting tree is copied into pyast::Node. Nothing
// from the submission is executed in-process.

#include "scriptbox/pyast.h"

#include <stdexcept>
#include <string>

namespace scriptbox::pyast {

// Parse failure, with the message and line the Python compiler reported.
// Sources nested too deeply for the compiler are reported the same way.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& msg, int line) : std::runtime_error(msg), line_(line) {}
    int line() const { return line_; }
private:
    int line_;
};

// Parses a complete module into a "Module" node. Source bytes are decoded
// the way the interpreter decodes a file (UTF-8 unless a coding cookie says
// otherwise). Throws SyntaxError; any other interpreter failure surfaces as
// std::runtime_error. Safe to call from any thread.
NodePtr parse_module(const std::string& src);

// "3.11.7": version of the embedded interpreter whose grammar is applied.
std::string parser_python_version();

bool parser_python_at_least(int major, int minor);

} // namespace scriptbox::pyast
