/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "stream/ByteRange.hh"
#include "util/Error.hh"

using namespace cgw;

TEST_CASE("whole object without Range header", "[normal]")
{
	std::error_code ec;
	auto subject = parse_range("", 1000, ec);
	REQUIRE(!ec);
	REQUIRE(subject.from == 0);
	REQUIRE(subject.until == 999);
	REQUIRE(subject.length() == 1000);
	REQUIRE_FALSE(subject.partial);

	subject = parse_range("  \t", 1000, ec);
	REQUIRE(!ec);
	REQUIRE(subject.until == 999);
	REQUIRE_FALSE(subject.partial);
}

TEST_CASE("empty object without Range header", "[normal]")
{
	std::error_code ec;
	auto subject = parse_range("", 0, ec);
	REQUIRE(!ec);
	REQUIRE(subject.empty());
	REQUIRE(subject.length() == 0);
}

TEST_CASE("closed and open ranges", "[normal]")
{
	std::error_code ec;
	auto subject = parse_range("bytes=0-499", 1000, ec);
	REQUIRE(!ec);
	REQUIRE(subject.from == 0);
	REQUIRE(subject.until == 499);
	REQUIRE(subject.partial);
	REQUIRE(subject.content_range(1000) == "bytes 0-499/1000");

	subject = parse_range("bytes=500-", 1000, ec);
	REQUIRE(!ec);
	REQUIRE(subject.from == 500);
	REQUIRE(subject.until == 999);
	REQUIRE(subject.length() == 500);

	subject = parse_range(" bytes=999-999 ", 1000, ec);
	REQUIRE(!ec);
	REQUIRE(subject.length() == 1);
}

TEST_CASE("ranges beyond the object", "[error]")
{
	std::error_code ec;
	parse_range("bytes=900-1500", 1000, ec);
	REQUIRE(ec == Error::range_not_satisfiable);

	parse_range("bytes=1000-", 1000, ec);
	REQUIRE(ec == Error::range_not_satisfiable);

	parse_range("bytes=500-400", 1000, ec);
	REQUIRE(ec == Error::range_not_satisfiable);

	parse_range("bytes=0-", 0, ec);
	REQUIRE(ec == Error::range_not_satisfiable);

	REQUIRE(unsatisfiable_range(1000) == "bytes */1000");
}

TEST_CASE("malformed Range headers", "[error]")
{
	std::error_code ec;
	for (auto header : {
		"bytes", "bytes=", "bytes=abc-def", "bytes=-500", "items=0-1", "bytes=1-2,5-6",
		"bytes=1-2-3", "bytes=1", "bytes=+1-2", "bytes=1-x", "bytes=99999999999999999999-"
	})
	{
		INFO(header);
		parse_range(header, 1000, ec);
		REQUIRE(ec == Error::malformed_range);
	}
}

TEST_CASE("a successful parse clears the previous error", "[normal]")
{
	std::error_code ec{Error::malformed_range};
	parse_range("bytes=1-2", 10, ec);
	REQUIRE(!ec);
}
