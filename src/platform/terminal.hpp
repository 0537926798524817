#pragma once

namespace platform {

// Get terminal dimensions (80x24 when stdout is not a terminal).
int term_width();
int term_height();

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// SIGWINCH tracking. The handler only sets a flag; the main loop calls
// consume_resize() to learn whether the window changed since last time.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool consume_resize();

} // namespace platform
