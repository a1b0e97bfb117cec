/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include <system_error>

namespace cgw {

enum class Error
{
	ok,

	// client input
	malformed_range,
	range_not_satisfiable,
	malformed_token,
	invalid_fingerprint,
	invalid_request,

	// remote store
	object_not_found,
	upstream_unavailable,

	// registry and intake
	record_not_found,
	pending_not_found,
	registry_io,

	unknown_error
};

const std::error_category& chunkgate_error_category();
std::error_code make_error_code(Error err);

} // end of namespace cgw

namespace std
{
	template <> struct is_error_code_enum<cgw::Error> : true_type {};
}
