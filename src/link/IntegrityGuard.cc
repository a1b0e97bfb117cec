/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "IntegrityGuard.hh"
#include "LinkCodec.hh"

#include "util/Error.hh"

namespace cgw {

std::string_view IntegrityGuard::fingerprint(std::string_view unique_id)
{
	return unique_id.substr(0, fingerprint_length);
}

std::error_code IntegrityGuard::verify(const ObjectMetadata& meta, std::string_view presented)
{
	auto expected = fingerprint(meta.unique_id);
	return (expected.size() == fingerprint_length && presented == expected) ?
		std::error_code{} : std::error_code{Error::invalid_fingerprint};
}

std::tuple<std::string_view, std::string_view> IntegrityGuard::split(std::string_view segment, std::error_code& ec)
{
	if (segment.size() != fingerprint_length + LinkCodec::token_length)
	{
		ec = Error::malformed_token;
		return {};
	}

	ec.clear();
	return {segment.substr(0, fingerprint_length), segment.substr(fingerprint_length)};
}

} // end of namespace cgw
