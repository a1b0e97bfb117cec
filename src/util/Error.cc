/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Error.hh"

#include <string>

namespace cgw {

const std::error_category& chunkgate_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "chunkgate"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::malformed_range: return "malformed range";
				case Error::range_not_satisfiable: return "range not satisfiable";
				case Error::malformed_token: return "malformed token";
				case Error::invalid_fingerprint: return "invalid fingerprint";
				case Error::invalid_request: return "invalid request";
				case Error::object_not_found: return "object not found";
				case Error::upstream_unavailable: return "upstream unavailable";
				case Error::record_not_found: return "record not found";
				case Error::pending_not_found: return "pending association not found";
				case Error::registry_io: return "registry I/O error";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), chunkgate_error_category());
}

} // end of namespace
