#pragma once

/**
 * @brief Handles the 'cat-file' command.
 *
 * Implements `git cat-file (-p | -t | -s) <object-sha>`: pretty-prints the
 * object's content, or prints its kind or payload size.
 */
int handleCatFile(int argc, char* argv[]);
