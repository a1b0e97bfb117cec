/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#include "Blake2.hh"

#include <openssl/err.h>

#include <system_error>
#include <utility>

namespace cgw {

Blake2::Blake2() : m_ctx{NewHashCTX(::EVP_blake2b512())}
{
}

Blake2::Blake2(const Blake2& src) : Blake2()
{
	if (::EVP_MD_CTX_copy_ex(m_ctx.get(), src.m_ctx.get()) != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}

Blake2& Blake2::operator=(const Blake2& src)
{
	auto copy{src};
	std::swap(m_ctx, copy.m_ctx);
	return *this;
}

void Blake2::update(const void *data, std::size_t len)
{
	cgw::update(m_ctx.get(), data, len);
}

std::array<unsigned char, Blake2::size> Blake2::finalize()
{
	std::array<unsigned char, Blake2::size> result{};
	cgw::finalize(m_ctx.get(), result.data(), result.size());
	return result;
}

} // end of namespace cgw
