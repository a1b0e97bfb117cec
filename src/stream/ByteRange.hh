/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace cgw {

/// A validated, inclusive byte window [from, until] of an object.
/// An empty window has until == from - 1.
struct ByteRange
{
	std::int64_t from{};
	std::int64_t until{-1};
	bool partial{false};

	std::int64_t length() const {return until - from + 1;}
	bool empty() const {return length() <= 0;}

	/// "bytes <from>-<until>/<total>"
	std::string content_range(std::int64_t total) const;
};

/// Parse a Range header value against the total size of an object.
/// Only a single "bytes=<from>-[<until>]" is accepted. On failure \a ec is
/// set to Error::malformed_range or Error::range_not_satisfiable.
ByteRange parse_range(std::string_view header, std::int64_t total_size, std::error_code& ec);

/// "bytes */<total>", sent together with 416.
std::string unsatisfiable_range(std::int64_t total);

} // end of namespace cgw
