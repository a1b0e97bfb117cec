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

// BLAKE2b with a 512-bit digest. Used for keyed link checks and keystreams.
class Blake2
{
public:
	Blake2();
	Blake2(Blake2&&) = default;
	Blake2(const Blake2& src);
	~Blake2() = default;

	Blake2& operator=(Blake2&&) = default;
	Blake2& operator=(const Blake2& src);

	static const std::size_t size = 64;

	void update(const void *data, std::size_t len);
	void update(std::string_view data) {update(data.data(), data.size());}
	std::array<unsigned char, size> finalize();

private:
	HashCTX m_ctx;
};

} // end of namespace cgw
