// Included first so the header must compile on its own.
#include <manifestspace/core/Error.hpp>

#include <doctest/doctest.h>

using namespace MS;

TEST_SUITE("core.error") {
TEST_CASE("describeError joins code and message") {
    Error error{Error::Code::NotFound, "manifest entry not found"};
    CHECK(describeError(error) == "not_found:manifest entry not found");

    Error bare{Error::Code::IOFailure, ""};
    CHECK(describeError(bare) == "io_failure");
}

TEST_CASE("wrapError keeps the inner description") {
    Error inner{Error::Code::IOFailure, "disk full"};
    auto  wrapped = wrapError(inner, Error::Code::CommitFailed, "put maintenance manifest");
    CHECK(wrapped.code == Error::Code::CommitFailed);
    REQUIRE(wrapped.message.has_value());
    CHECK(*wrapped.message == "put maintenance manifest: io_failure:disk full");
}

TEST_CASE("every code has a stable name") {
    CHECK(errorCodeToString(Error::Code::LookupFailed) == "lookup_failed");
    CHECK(errorCodeToString(Error::Code::LoadFailed) == "load_failed");
    CHECK(errorCodeToString(Error::Code::CommitFailed) == "commit_failed");
    CHECK(errorCodeToString(Error::Code::RetireFailed) == "retire_failed");
    CHECK(errorCodeToString(Error::Code::MalformedInput) == "malformed_input");
}
}
