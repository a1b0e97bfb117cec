/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#pragma once

#include <openssl/evp.h>

#include <memory>

namespace cgw {

struct HashCTXRelease
{
	void operator()(EVP_MD_CTX *ctx) const;
};

using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

/// Create a digest context initialized with \a md. Throws std::system_error
/// if OpenSSL refuses.
HashCTX NewHashCTX(const EVP_MD *md);

void update(EVP_MD_CTX *ctx, const void *data, std::size_t len);
std::size_t finalize(EVP_MD_CTX *ctx, unsigned char *out, std::size_t len);

} // end of namespace cgw
