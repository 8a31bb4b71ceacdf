#include <gtest/gtest.h>
#include <core/types.hpp>

// ── Error::to_string ────────────────────────────────────────

TEST(Error, TransportErrorIsJustTheMessage) {
    EXPECT_EQ(Error::transport("Failed to open channel").to_string(), "Failed to open channel");
}

TEST(Error, CommandErrorIncludesCommandStatusAndStderr) {
    Error e;
    e.kind = ErrorKind::Command;
    e.message = "Process exited with status 1";
    e.command = "cat /missing";
    e.stderr_data = "cat: /missing: No such file or directory\n";
    EXPECT_EQ(e.to_string(),
              "`cat /missing`\n"
              "  Process exited with status 1\n"
              "  cat: /missing: No such file or directory");
}

TEST(Error, WrapPrefixesContextAndKeepsCommandDetail) {
    Error e;
    e.kind = ErrorKind::Command;
    e.message = "Process exited with status 1";
    e.command = "rm /x";
    e.stderr_data = "boom\n";

    Error wrapped = e.wrap("Could not delete file /x");
    EXPECT_EQ(wrapped.kind, ErrorKind::Command);
    EXPECT_EQ(wrapped.message, "Could not delete file /x: Process exited with status 1");
    EXPECT_EQ(wrapped.command, "rm /x");
    EXPECT_EQ(wrapped.stderr_data, "boom\n");
}

TEST(Error, WrapOnEmptyMessage) {
    Error e;
    EXPECT_EQ(e.wrap("context").message, "context");
}

// ── Result ──────────────────────────────────────────────────

TEST(Result, OkCarriesValue) {
    auto r = Result<int>::Ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 42);
}

TEST(Result, StringErrIsConfigKind) {
    auto r = Result<void>::Err("bad manifest");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Config);
    EXPECT_EQ(r.error.message, "bad manifest");
}
