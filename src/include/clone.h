#pragma once

/**
 * @brief Handles the 'clone' command.
 *
 * Implements `git clone <url> [directory]`, fetching a repository over the
 * smart HTTP protocol, creating the local repository, and checking out HEAD.
 */
int handleClone(int argc, char* argv[]);
