#pragma once
#ifndef TESTFORGE_ERRORS_H
#define TESTFORGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace testforge {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A source file could not be turned into a structural tree
class ParseError : public Error {
public:
    ParseError(const std::string& file, int line, const std::string& detail);

    const std::string& file() const { return file_; }
    int line() const { return line_; }

private:
    std::string file_;
    int line_;
};

class CoverageError : public Error {
public:
    using Error::Error;
};

class ReportError : public Error {
public:
    using Error::Error;
};

class ModelError : public Error {
public:
    using Error::Error;
};

class PatchError : public Error {
public:
    using Error::Error;
};

}  // namespace testforge

#endif  // TESTFORGE_ERRORS_H
