/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#include "EVPWrapper.hh"

#include <openssl/err.h>

#include <system_error>

namespace cgw {
namespace {

[[noreturn]] void throw_openssl_error()
{
	throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}

} // end of local namespace

void HashCTXRelease::operator()(EVP_MD_CTX *ctx) const
{
	::EVP_MD_CTX_free(ctx);
}

HashCTX NewHashCTX(const EVP_MD *md)
{
	HashCTX ctx{::EVP_MD_CTX_new(), HashCTXRelease{}};
	if (!ctx || ::EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
		throw_openssl_error();
	return ctx;
}

void update(EVP_MD_CTX *ctx, const void *data, std::size_t len)
{
	if (::EVP_DigestUpdate(ctx, data, len) != 1)
		throw_openssl_error();
}

std::size_t finalize(EVP_MD_CTX *ctx, unsigned char *out, std::size_t len)
{
	// EVP_DigestFinal_ex() always writes the full digest
	if (len < static_cast<std::size_t>(::EVP_MD_CTX_get_size(ctx)))
		throw std::system_error(std::make_error_code(std::errc::no_buffer_space));

	unsigned ilen = 0;
	if (::EVP_DigestFinal_ex(ctx, out, &ilen) != 1)
		throw_openssl_error();
	return ilen;
}

} // end of namespace cgw
