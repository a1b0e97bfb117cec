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

#include "EVPWrapper.hh"

#include <array>
#include <string_view>

namespace cgw {

// SHA-256 content hash used for deduplication of uploaded objects.
class SHA2
{
public:
	SHA2();
	SHA2(SHA2&&) = default;
	SHA2(const SHA2& src);
	~SHA2() = default;

	SHA2& operator=(SHA2&&) = default;
	SHA2& operator=(const SHA2& src);

	static const std::size_t size = 32;

	void update(const void *data, std::size_t len);
	void update(std::string_view data) {update(data.data(), data.size());}
	std::array<unsigned char, size> finalize();

private:
	HashCTX m_ctx;
};

} // end of namespace cgw
