#pragma once

// planwarden <command> <plan.json>
// Each returns the process exit code: 0 success, 1 fatal, 2 usage.

int cmd_run(int argc, char** argv);
int cmd_hash(int argc, char** argv);
int cmd_attest(int argc, char** argv);
int cmd_verify(int argc, char** argv);
