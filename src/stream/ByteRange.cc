/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "ByteRange.hh"

#include "util/Error.hh"

#include <charconv>

namespace cgw {
namespace {

bool parse_offset(std::string_view str, std::int64_t& out)
{
	if (str.empty())
		return false;

	auto [end, err] = std::from_chars(str.data(), str.data() + str.size(), out);
	return err == std::errc{} && end == str.data() + str.size() && out >= 0;
}

} // end of local namespace

std::string ByteRange::content_range(std::int64_t total) const
{
	return "bytes " + std::to_string(from) + "-" + std::to_string(until) + "/" + std::to_string(total);
}

std::string unsatisfiable_range(std::int64_t total)
{
	return "bytes */" + std::to_string(total);
}

ByteRange parse_range(std::string_view header, std::int64_t total_size, std::error_code& ec)
{
	ec.clear();

	auto first = header.find_first_not_of(" \t");
	header = first == header.npos ? std::string_view{} : header.substr(first, header.find_last_not_of(" \t") - first + 1);

	// Whole object. The window is empty for zero-length objects.
	if (header.empty())
		return ByteRange{0, total_size - 1, false};

	static const std::string_view unit{"bytes="};
	if (header.substr(0, unit.size()) != unit)
	{
		ec = Error::malformed_range;
		return {};
	}
	header.remove_prefix(unit.size());

	// multiple ranges are not supported
	auto dash = header.find('-');
	if (dash == header.npos || header.find_first_of(",-", dash + 1) != header.npos)
	{
		ec = Error::malformed_range;
		return {};
	}

	ByteRange result{0, total_size - 1, true};

	// suffix ranges (i.e. "bytes=-500") are rejected as malformed
	if (!parse_offset(header.substr(0, dash), result.from))
	{
		ec = Error::malformed_range;
		return {};
	}

	auto until = header.substr(dash + 1);
	if (!until.empty() && !parse_offset(until, result.until))
	{
		ec = Error::malformed_range;
		return {};
	}

	if (result.until > total_size - 1 || result.until < result.from)
	{
		ec = Error::range_not_satisfiable;
		return {};
	}
	return result;
}

} // end of namespace cgw
