/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#include "LinkCodec.hh"

#include "crypto/Blake2.hh"
#include "util/Error.hh"
#include "util/Escape.hh"

#include <boost/endian/conversion.hpp>
#include <boost/exception/info.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <cstring>

namespace cgw {
namespace {

// domain separation between the check and the keystream
const std::string_view check_label{"chunkgate.link.check"};
const std::string_view mask_label{"chunkgate.link.mask"};

void hash_key(Blake2& hash, std::string_view secret, std::string_view label)
{
	auto size = boost::endian::native_to_big(static_cast<std::uint64_t>(secret.size()));
	hash.update(&size, sizeof(size));
	hash.update(secret);
	hash.update(label);
}

} // end of local namespace

LinkCodec::LinkCodec(std::string secret) : m_secret{std::move(secret)}
{
	if (m_secret.empty())
		BOOST_THROW_EXCEPTION(Error() << Message{"link secret must not be empty"});
}

LinkCodec::Check LinkCodec::check(const Payload& payload) const
{
	Blake2 hash;
	hash_key(hash, m_secret, check_label);
	hash.update(payload.data(), payload.size());

	auto digest = hash.finalize();
	Check result{};
	std::copy_n(digest.begin(), result.size(), result.begin());
	return result;
}

void LinkCodec::mask(Payload& payload, const Check& check) const
{
	Blake2 hash;
	hash_key(hash, m_secret, mask_label);
	hash.update(check.data(), check.size());

	auto keystream = hash.finalize();
	static_assert(Blake2::size >= payload_size);
	for (std::size_t i = 0; i < payload.size(); ++i)
		payload[i] ^= keystream[i];
}

std::string LinkCodec::encode(const ObjectCoordinate& coord) const
{
	Payload payload{};
	payload[0] = version;

	auto container = boost::endian::native_to_big(static_cast<std::uint64_t>(coord.container));
	auto object    = boost::endian::native_to_big(static_cast<std::uint64_t>(coord.object));
	std::memcpy(&payload[1], &container, sizeof(container));
	std::memcpy(&payload[9], &object,    sizeof(object));

	auto chk = check(payload);
	mask(payload, chk);

	std::string bytes(payload.begin(), payload.end());
	bytes.append(chk.begin(), chk.end());
	return base64url_encode(bytes);
}

ObjectCoordinate LinkCodec::decode(std::string_view token, std::error_code& ec) const
{
	ec = cgw::Error::malformed_token;
	if (token.size() != token_length)
		return {};

	auto bytes = base64url_decode(token);

	// reject non-canonical encodings of the unused trailing bits
	if (!bytes || bytes->size() != payload_size + check_size || base64url_encode(*bytes) != token)
		return {};

	Payload payload{};
	Check   chk{};
	std::copy_n(bytes->begin(), payload.size(), payload.begin());
	std::copy_n(bytes->begin() + payload.size(), chk.size(), chk.begin());

	mask(payload, chk);
	if (payload[0] != version)
		return {};

	auto expected = check(payload);
	if (::CRYPTO_memcmp(expected.data(), chk.data(), chk.size()) != 0)
		return {};

	std::uint64_t container{}, object{};
	std::memcpy(&container, &payload[1], sizeof(container));
	std::memcpy(&object,    &payload[9], sizeof(object));

	ec.clear();
	return ObjectCoordinate{
		static_cast<std::int64_t>(boost::endian::big_to_native(container)),
		static_cast<std::int64_t>(boost::endian::big_to_native(object))
	};
}

} // end of namespace cgw
