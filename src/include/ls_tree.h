#pragma once

/**
 * @brief Handles the 'ls-tree' command.
 *
 * Implements `git ls-tree [--name-only] <tree-ish>`, listing mode, kind, SHA
 * and name of each entry of a tree. A commit SHA lists the commit's root tree.
 */
int handleLsTree(int argc, char* argv[]);
