#pragma once

/**
 * @brief Handles the 'hash-object' command.
 *
 * Implements `git hash-object [-w] [-t <kind>] <file>`: prints the address the
 * file's content would have as an object of the given kind (blob by default)
 * and, with `-w`, writes it to the object database.
 */
int handleHashObject(int argc, char* argv[]);
