#pragma once

namespace gitstamp::cli {

// Receives argv starting at the command name; returns the process exit status
using command_fn = int (*)(int argc, char **argv);

} // namespace gitstamp::cli
