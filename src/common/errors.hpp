#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace matchwire {

enum class ErrorKind {
    Transport,
    Deserialization,
    ResolutionFailure,
    InvalidAddress,
    Filesystem,
    CommandParse
};

std::string_view ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string &message, const char *file = nullptr, int line = 0);

    ErrorKind kind() const noexcept { return kind_; }
    const char *file() const noexcept { return file_; }
    int line() const noexcept { return line_; }

private:
    ErrorKind kind_;
    const char *file_;
    int line_;
};

// Formats "<kind>: <message>" for user facing output.
std::string DescribeError(const Error &error);

// Logs uncaught exceptions and fatal signals before default termination.
void InstallCrashHandlers();

} // namespace matchwire

#define MATCHWIRE_ERROR(kind, message) ::matchwire::Error((kind), (message), __FILE__, __LINE__)
