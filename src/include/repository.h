#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Creates the `.git` skeleton (objects/, refs/heads, refs/tags, HEAD) under `worktree`.
 *
 * HEAD points at `refs/heads/main`. Existing files are left untouched, so
 * running it on an initialized repository is harmless.
 *
 * @return The path of the `.git` directory.
 * @throws std::filesystem::filesystem_error on filesystem failure.
 */
std::filesystem::path initRepository(const std::filesystem::path& worktree);

/**
 * @brief Checks that a ref name is safe to use as a path below `.git`.
 * Accepts "HEAD" and names under "refs/" without empty, "." or ".." components.
 */
bool isValidRefName(std::string_view refName);

/**
 * @brief Writes `<sha1Hex>\n` to `<gitDir>/<refName>`, creating directories as needed.
 * @throws std::invalid_argument if the ref name is not valid.
 */
void writeRef(const std::filesystem::path& gitDir, std::string_view refName, std::string_view sha1Hex);

/**
 * @brief Points HEAD at a branch (`ref: <refName>`).
 */
void writeSymbolicHead(const std::filesystem::path& gitDir, std::string_view refName);

/**
 * @brief Resolves a ref (following one level of `ref:` indirection for HEAD) to an address.
 * @return The 40-hex address, or std::nullopt if the ref does not exist or is unborn.
 */
std::optional<std::string> readRef(const std::filesystem::path& gitDir, std::string_view refName);
