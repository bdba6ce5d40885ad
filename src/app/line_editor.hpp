#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matchwire::app {

// Line buffered reader over a non-blocking descriptor (stdin in practice).
// The terminal stays in canonical mode, so the editor only has to assemble
// submitted lines and keep a history of them.
class LineEditor {
public:
    explicit LineEditor(int fd, std::string prompt = "> ", std::size_t historyLimit = 200);

    int fd() const { return inputFd; }
    bool closed() const { return endOfInput; }

    void renderPrompt() const;

    // Returns a buffered line, or performs one read and returns the first
    // line it completed.
    std::optional<std::string> poll();

    // Returns the next already buffered line without reading.
    std::optional<std::string> nextBufferedLine();

    const std::vector<std::string> &history() const { return entries; }

private:
    void remember(const std::string &line);

    int inputFd;
    std::string prompt;
    std::size_t historyLimit;
    std::string buffer;
    std::vector<std::string> entries;
    bool endOfInput = false;
};

} // namespace matchwire::app
