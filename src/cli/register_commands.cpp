#include "cli/registry.hpp"

int cmd_version(int argc, char **argv);
int cmd_head(int, char **);
int cmd_status(int, char **);
int cmd_emit(int, char **);

namespace gitstamp::cli {

void register_all_commands() {
  register_command("version", ::cmd_version,
                   "Print the build version: [--suffix S] [--abbrev N] [--no-untracked]");
  register_command("head", ::cmd_head, "Print the commit HEAD resolves to and its branch");
  register_command("status", ::cmd_status,
                   "List the changes that mark the tree modified: [--no-untracked]");
  register_command("emit", ::cmd_emit,
                   "Render the stamp: --format text|properties|header [--prefix P] "
                   "[--output FILE]");
}

} // namespace gitstamp::cli
