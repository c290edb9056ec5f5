#pragma once

#include <string>

// Print the backup command usage information
void printBackupUsage();

// Entry point for the job subcommands; argv[0] is the subcommand
int backupMain(int argc, char* argv[]);
