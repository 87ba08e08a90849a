#pragma once
/*
 * Menu
 *
 * Purpose: ready-made read loop around a Session that hands every submission to a handler.
 * Keys: Ctrl+C ends the loop; Ctrl+D clears the buffer but still runs the handler on its text.
 * Errors: a handler that returns false has its message drawn beside the line, which stays open.
 */
#include <functional>
#include <string>
#include "session.hpp"

enum class Response {
  Accept,   // record the buffer in history and clear it
  Deny,     // clear the buffer
  Break,    // leave the loop
  Continue  // keep the buffer and read more lines into it
};

// return false with err set to reject the line
using LineHandler = std::function<bool(const std::string& line, Response& resp, std::string& err)>;
using SessionHandler =
    std::function<bool(Session& rl, const std::string& line, Response& resp, std::string& err)>;

// Both return the outcome that ended the loop: ok() after Ctrl+C or Break,
// otherwise the failed read (end of input, malformed input, I/O failure).
ReadResult read_and(Session& rl, const LineHandler& fn);
ReadResult read_and_mut(Session& rl, const SessionHandler& fn);
