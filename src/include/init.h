#pragma once

/**
 * @brief Handles the 'init' command.
 *
 * Initializes a new, empty Git repository in the current directory by creating
 * the required directory structure and the HEAD file.
 */
int handleInit();
