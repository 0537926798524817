#pragma once

#include <string>
#include "terminal.hpp"

// Interactive loop on readline's callback interface: stdin is polled so
// background output is printed while the user is at the prompt.
class Repl {
public:
    explicit Repl(Terminal& term);
    ~Repl();

    Repl(const Repl&) = delete;
    Repl& operator=(const Repl&) = delete;

    // Returns the process exit code.
    int run();

private:
    Terminal& term_;
    std::string prompt_;
    bool eof_ = false;
    bool mid_line_ = false;    // last fragment did not end with a newline

    static Repl* active_;
    static void on_line(char* line);

    void handle_line(const std::string& line);
    void print_record(const TranscriptRecord& record, const std::string& added);
    void refresh_prompt();

    // Print above the prompt without losing what the user is typing.
    void print_above(const std::string& text);
};

// Print every record of the transcript (used by one-shot `-c` runs).
void print_transcript(const Transcript& transcript);
