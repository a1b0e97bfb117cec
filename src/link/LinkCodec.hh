/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "stream/RemoteSession.hh"
#include "util/Exception.hh"

#include <array>
#include <string>
#include <string_view>
#include <system_error>

namespace cgw {

/// \brief  Maps an ObjectCoordinate to an opaque URL-safe token and back.
///
/// Token layout before encoding: 1 version byte, container and object as
/// big-endian 64-bit integers, then 3 bytes of keyed BLAKE2b check. The
/// first 17 bytes are masked by a keystream derived from the secret and the
/// check. The 20 bytes are base64url encoded without padding.
class LinkCodec
{
public:
	struct Error : virtual Exception {};

	static constexpr std::size_t token_length = 27;
	static const unsigned char version = 0x01;

public:
	explicit LinkCodec(std::string secret);

	std::string encode(const ObjectCoordinate& coord) const;
	ObjectCoordinate decode(std::string_view token, std::error_code& ec) const;

private:
	static const std::size_t payload_size = 17;
	static const std::size_t check_size = 3;
	using Payload = std::array<unsigned char, payload_size>;
	using Check   = std::array<unsigned char, check_size>;

	Check check(const Payload& payload) const;
	void mask(Payload& payload, const Check& check) const;

private:
	std::string m_secret;
};

} // end of namespace cgw
