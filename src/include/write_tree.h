#pragma once

/**
 * @brief Handles the 'write-tree' command.
 * Creates a tree object from the current directory state and prints its SHA.
 */
int handleWriteTree(int argc, char* argv[]);
