/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "stream/RemoteSession.hh"

#include <string_view>
#include <system_error>
#include <tuple>

namespace cgw {

/// Checks that an object resolved from a link token is the object the link
/// was issued for, by comparing a short prefix of its store-assigned unique id.
class IntegrityGuard
{
public:
	static constexpr std::size_t fingerprint_length = 6;

	static std::string_view fingerprint(std::string_view unique_id);

	/// Error::invalid_fingerprint if \a presented does not match the object.
	static std::error_code verify(const ObjectMetadata& meta, std::string_view presented);

	/// Split the {fingerprint+token} path segment of a download URL.
	/// Error::malformed_token if the segment has the wrong length.
	static std::tuple<std::string_view, std::string_view> split(std::string_view segment, std::error_code& ec);
};

} // end of namespace cgw
