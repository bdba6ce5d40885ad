#include "app/line_editor.hpp"

#include <array>
#include <cerrno>
#include <iostream>
#include <unistd.h>

namespace matchwire::app {

LineEditor::LineEditor(int fd, std::string prompt, std::size_t historyLimit)
    : inputFd(fd),
      prompt(std::move(prompt)),
      historyLimit(historyLimit) {}

void LineEditor::renderPrompt() const {
    std::cout << prompt << std::flush;
}

std::optional<std::string> LineEditor::poll() {
    if (auto line = nextBufferedLine()) {
        return line;
    }
    if (endOfInput) {
        return std::nullopt;
    }

    std::array<char, 1024> chunk{};
    const ssize_t count = ::read(inputFd, chunk.data(), chunk.size());
    if (count == 0) {
        endOfInput = true;
        if (!buffer.empty()) {
            std::string line = std::move(buffer);
            buffer.clear();
            remember(line);
            return line;
        }
        return std::nullopt;
    }
    if (count < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            endOfInput = true;
        }
        return std::nullopt;
    }
    buffer.append(chunk.data(), static_cast<std::size_t>(count));
    return nextBufferedLine();
}

std::optional<std::string> LineEditor::nextBufferedLine() {
    const auto newline = buffer.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(0, newline);
    buffer.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    remember(line);
    return line;
}

void LineEditor::remember(const std::string &line) {
    if (line.empty() || (!entries.empty() && entries.back() == line)) {
        return;
    }
    entries.push_back(line);
    if (entries.size() > historyLimit) {
        entries.erase(entries.begin());
    }
}

} // namespace matchwire::app
