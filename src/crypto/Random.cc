/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#include "Random.hh"

#include <limits>
#include <system_error>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace {

template <typename OpenSSLRandomFunction>
inline void open_ssl_rand(void *buf, std::size_t size, OpenSSLRandomFunction&& func)
{
	if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
		throw std::system_error(std::make_error_code(std::errc::value_too_large));

	if (func(reinterpret_cast<unsigned char*>(buf), static_cast<int>(size)) != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}

} // end of local namespace

namespace cgw {

void secure_random(void *buf, std::size_t size)
{
	open_ssl_rand(buf, size, ::RAND_priv_bytes);
}

void insecure_random(void *buf, std::size_t size)
{
	open_ssl_rand(buf, size, ::RAND_bytes);
}

} // end of namespace cgw
