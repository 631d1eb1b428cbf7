#include <catch2/catch.hpp>

#include "chatarc/status.h"

using namespace chatarc;

TEST_CASE("Default status is ok", "[status]")
{
    Status s;
    REQUIRE(s.ok());
    REQUIRE(s.code() == ErrorCode::kOk);
    REQUIRE(s.message().empty());
    REQUIRE(s.ToString() == "OK");
}

TEST_CASE("Factories carry code and owned message", "[status]")
{
    std::string msg = "open /tmp/x: No such file";
    Status s = Status::IOError(msg);
    msg.assign("overwritten");

    REQUIRE_FALSE(s.ok());
    REQUIRE(s.code() == ErrorCode::kIO);
    REQUIRE(s.message() == "open /tmp/x: No such file");
    REQUIRE(s.ToString() == "IOError: open /tmp/x: No such file");
}

TEST_CASE("Archive error taxonomy", "[status]")
{
    REQUIRE(Status::FormatError("bad magic").IsFormatError());
    REQUIRE(Status::AlreadyExists().IsAlreadyExists());
    REQUIRE(Status::TransportError("reset").code() == ErrorCode::kTransport);
    REQUIRE(Status::ChannelNotFound().IsNotFound());
    REQUIRE(Status::InvalidArgument("x").code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Propagation keeps the first error", "[status]")
{
    auto low = []() -> Status { return Status::FormatError("invalid metadata size"); };
    auto high = [&low]() -> Status {
        Status s = low();
        if (!s.ok()) return s;
        return Status::Ok();
    };

    Status result = high();
    REQUIRE(result.code() == ErrorCode::kFormat);
    REQUIRE(result.message() == "invalid metadata size");
}
