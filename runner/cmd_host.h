#pragma once

// kestrel_host run: the long-running daemon.
int cmd_run(int argc, char** argv);

// Inspection commands (cmd_inspect.cpp).
int cmd_check_mounts(int argc, char** argv);
int cmd_cron_next(int argc, char** argv);
int cmd_tasks(int argc, char** argv);
