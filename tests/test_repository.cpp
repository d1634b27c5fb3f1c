#include <catch2/catch.hpp>
#include "test_helpers.h"

#include "repository.h"

#include <stdexcept>

TEST_CASE("Init creates the repository layout", "[repository]") {
    TempDir tmp;
    const fs::path gitDir = initRepository(tmp.path());

    CHECK(gitDir == tmp.path() / ".git");
    CHECK(fs::is_directory(gitDir / "objects"));
    CHECK(fs::is_directory(gitDir / "refs/heads"));
    CHECK(fs::is_directory(gitDir / "refs/tags"));
    CHECK(readFile(gitDir / "HEAD") == "ref: refs/heads/main\n");
}

TEST_CASE("Init leaves an existing HEAD alone", "[repository]") {
    TempDir tmp;
    writeFile(tmp.path() / ".git/HEAD", "ref: refs/heads/trunk\n");
    initRepository(tmp.path());
    CHECK(readFile(tmp.path() / ".git/HEAD") == "ref: refs/heads/trunk\n");
}

TEST_CASE("Refs are written and resolved", "[repository]") {
    TempDir tmp;
    const fs::path gitDir = initRepository(tmp.path());

    // HEAD points at an unborn branch right after init.
    CHECK_FALSE(readRef(gitDir, "HEAD").has_value());

    writeRef(gitDir, "refs/heads/main", "95D09F2B10159347EECE71399A7E2E907EA3DF4F");
    CHECK(readFile(gitDir / "refs/heads/main") == "95d09f2b10159347eece71399a7e2e907ea3df4f\n");
    CHECK(readRef(gitDir, "refs/heads/main") == "95d09f2b10159347eece71399a7e2e907ea3df4f");
    CHECK(readRef(gitDir, "HEAD") == "95d09f2b10159347eece71399a7e2e907ea3df4f");

    writeRef(gitDir, "refs/heads/feature/x", "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    writeSymbolicHead(gitDir, "refs/heads/feature/x");
    CHECK(readFile(gitDir / "HEAD") == "ref: refs/heads/feature/x\n");
    CHECK(readRef(gitDir, "HEAD") == "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
}

TEST_CASE("Detached HEAD holds an address", "[repository]") {
    TempDir tmp;
    const fs::path gitDir = initRepository(tmp.path());
    writeRef(gitDir, "HEAD", "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    CHECK(readRef(gitDir, "HEAD") == "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
}

TEST_CASE("Ref names are validated", "[repository]") {
    CHECK(isValidRefName("HEAD"));
    CHECK(isValidRefName("refs/heads/main"));
    CHECK(isValidRefName("refs/tags/v1.0"));
    CHECK_FALSE(isValidRefName(""));
    CHECK_FALSE(isValidRefName("main"));
    CHECK_FALSE(isValidRefName("refs/heads/../../config"));
    CHECK_FALSE(isValidRefName("refs/heads//main"));
    CHECK_FALSE(isValidRefName("refs/heads/main/"));
    CHECK_FALSE(isValidRefName("refs/heads/ma in"));

    TempDir tmp;
    CHECK_THROWS_AS(writeRef(tmp.path(), "refs/../HEAD", "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391"),
                    std::invalid_argument);
}
