#include "cli/registry.hpp"

int cmd_status(int, char **);
int cmd_select(int, char **);
int cmd_stage(int, char **);
int cmd_unstage(int, char **);
int cmd_discard(int, char **);
int cmd_goto(int, char **);
int cmd_yank(int, char **);

namespace gitstage::cli {

void register_all_commands() {
  register_command("status", {::cmd_status, "[--signs]", "Print the status buffer"});
  register_command("select", {::cmd_select, "<from>[:<to>]", "Show what a line range selects"});
  register_command("stage", {::cmd_stage, "<from>[:<to>] [--partial]",
                             "Stage files, hunks or lines under a range"});
  register_command("unstage", {::cmd_unstage, "<from>[:<to>] [--partial]",
                               "Unstage files, hunks or lines under a range"});
  register_command("discard", {::cmd_discard, "<from>[:<to>] [--partial] [--yes]",
                               "Throw away changes under a range"});
  register_command("goto", {::cmd_goto, "<line>", "Show the file, submodule or commit behind a line"});
  register_command("yank", {::cmd_yank, "<from>[:<to>]", "Print the object id or name under a range"});
}

} // namespace gitstage::cli
