#include "app/game_console.hpp"

#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pty.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr std::string_view kConnectingPrefix = "Connecting to ";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

namespace matchwire::app {

std::optional<ConnectionRecord> ParseConnectionEvent(std::string_view line) {
    const auto prefix = line.find(kConnectingPrefix);
    if (prefix == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view rest = trim(line.substr(prefix + kConnectingPrefix.size()));
    while (!rest.empty() && (rest.back() == '.' || rest.back() == '\r')) {
        rest.remove_suffix(1);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    ConnectionRecord record;
    if (rest.back() == ')') {
        const auto open = rest.rfind('(');
        if (open == std::string_view::npos) {
            return std::nullopt;
        }
        record.hostName = std::string(trim(rest.substr(0, open)));
        record.address = std::string(trim(rest.substr(open + 1, rest.size() - open - 2)));
    } else {
        record.address = std::string(rest);
        record.hostName = record.address;
    }
    if (record.address.empty() || record.address.find(' ') != std::string::npos) {
        return std::nullopt;
    }
    return record;
}

std::string StripTerminalControl(std::string_view text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '\x1b') {
            // CSI: ESC [ params final-byte(0x40-0x7e); other escapes are two bytes.
            if (i + 1 < text.size() && text[i + 1] == '[') {
                i += 2;
                while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7e)) {
                    ++i;
                }
            } else {
                ++i;
            }
            continue;
        }
        if (ch == '\r') {
            continue;
        }
        cleaned.push_back(ch);
    }
    return cleaned;
}

GameConsole::~GameConsole() {
    terminate();
}

void GameConsole::terminate() {
    if (childPid > 0) {
        ::kill(childPid, SIGTERM);
        ::waitpid(childPid, nullptr, WNOHANG);
        childPid = -1;
    }
    closeSession();
}

bool GameConsole::isRunning() {
    if (childPid <= 0) {
        return false;
    }
    int status = 0;
    const pid_t result = ::waitpid(childPid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    spdlog::info("GameConsole: game process {} exited", childPid);
    childPid = -1;
    closeSession();
    return false;
}

void GameConsole::launch(const std::filesystem::path &gameDir, const std::vector<std::string> &command) {
    if (command.empty()) {
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "No launch command configured");
    }
    if (isRunning()) {
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "The game is already running");
    }

    std::vector<std::string> args = command;
    std::error_code ec;
    const auto local = gameDir / args.front();
    if (std::filesystem::exists(local, ec)) {
        args.front() = local.string();
    }

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, nullptr, nullptr);
    if (pid < 0) {
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, std::string("forkpty failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (::chdir(gameDir.c_str()) != 0) {
            _exit(126);
        }
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto &arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        execvp(argv.front(), argv.data());
        _exit(127);
    }

    const int flags = ::fcntl(master, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(master, F_SETFL, flags | O_NONBLOCK);
    }
    childPid = pid;
    masterFd = master;
    pending.clear();
    spdlog::info("GameConsole: launched {} (pid {})", args.front(), pid);
}

void GameConsole::attachListener(std::shared_ptr<CommandContext> context) {
    listener = std::move(context);
    if (listener) {
        listener->setConnected(masterFd >= 0);
    }
}

void GameConsole::pump() {
    if (masterFd < 0) {
        return;
    }
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t count = ::read(masterFd, buffer.data(), buffer.size());
        if (count > 0) {
            pending.append(buffer.data(), static_cast<std::size_t>(count));
            std::size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                handleLine(pending.substr(0, newline));
                pending.erase(0, newline + 1);
            }
            continue;
        }
        if (count < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        // EOF or EIO: the child side of the terminal is gone.
        if (!pending.empty()) {
            handleLine(std::move(pending));
            pending.clear();
        }
        spdlog::info("GameConsole: console closed");
        closeSession();
        return;
    }
}

bool GameConsole::send(const std::string &line) {
    if (masterFd < 0) {
        return false;
    }
    const std::string payload = line + "\r\n";
    std::size_t written = 0;
    while (written < payload.size()) {
        const ssize_t count = ::write(masterFd, payload.data() + written, payload.size() - written);
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("GameConsole: write failed: {}", std::strerror(errno));
            return false;
        }
        written += static_cast<std::size_t>(count);
    }
    return true;
}

void GameConsole::handleLine(std::string line) {
    std::string cleaned = StripTerminalControl(line);
    if (!listener || cleaned.empty()) {
        return;
    }
    if (auto connection = ParseConnectionEvent(cleaned)) {
        spdlog::debug("GameConsole: connection to {} recorded", connection->address);
        listener->recordConnection(std::move(*connection));
    }
    listener->appendConsoleLine(std::move(cleaned));
}

void GameConsole::closeSession() {
    if (masterFd >= 0) {
        ::close(masterFd);
        masterFd = -1;
    }
    if (listener) {
        listener->setConnected(false);
    }
}

} // namespace matchwire::app
