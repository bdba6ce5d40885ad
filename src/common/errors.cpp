#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>

namespace {

std::terminate_handler g_previousTerminate = nullptr;

void LogTerminate() {
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const matchwire::Error &error) {
            spdlog::critical("PANIC {}:{}: {}", error.file() ? error.file() : "<unknown>", error.line(),
                             matchwire::DescribeError(error));
        } catch (const std::exception &ex) {
            spdlog::critical("PANIC: uncaught exception: {}", ex.what());
        } catch (...) {
            spdlog::critical("PANIC: uncaught exception of unknown type");
        }
    } else {
        spdlog::critical("PANIC: terminate called without an active exception");
    }
    spdlog::default_logger()->flush();

    if (g_previousTerminate) {
        g_previousTerminate();
    }
    std::abort();
}

void LogFatalSignal(int signum) {
    spdlog::critical("PANIC: fatal signal {} received", signum);
    spdlog::default_logger()->flush();
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

} // namespace

namespace matchwire {

std::string_view ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Transport:
        return "transport error";
    case ErrorKind::Deserialization:
        return "deserialization error";
    case ErrorKind::ResolutionFailure:
        return "resolution failure";
    case ErrorKind::InvalidAddress:
        return "invalid address";
    case ErrorKind::Filesystem:
        return "filesystem error";
    case ErrorKind::CommandParse:
        return "command parse error";
    }
    return "error";
}

Error::Error(ErrorKind kind, const std::string &message, const char *file, int line)
    : std::runtime_error(message),
      kind_(kind),
      file_(file),
      line_(line) {}

std::string DescribeError(const Error &error) {
    return std::string(ErrorKindName(error.kind())) + ": " + error.what();
}

void InstallCrashHandlers() {
    g_previousTerminate = std::set_terminate(LogTerminate);
    std::signal(SIGSEGV, LogFatalSignal);
    std::signal(SIGABRT, LogFatalSignal);
    std::signal(SIGFPE, LogFatalSignal);
}

} // namespace matchwire
