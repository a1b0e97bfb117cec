/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

#pragma once

#include "Request.hh"

#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/string_body.hpp>

#include <functional>
#include <memory>
#include <string_view>
#include <variant>

namespace cgw {

class ChunkStream;

using StringResponse = http::response<http::string_body>;
using EmptyResponse  = http::response<http::empty_body>;
using HeaderResponse = http::response<http::buffer_body>;

/// A response whose body is pulled from a ChunkStream while it is being
/// written. Content-Length must be set by the producer. A null stream
/// sends the header only, as for HEAD requests.
struct StreamResponse
{
	HeaderResponse                  header;
	std::shared_ptr<ChunkStream>    stream;
};

using Response = std::variant<StringResponse, EmptyResponse, StreamResponse>;
using ResponseSender = std::function<void(Response&&)>;

inline StringResponse text_response(http::status status, std::string_view text, unsigned version)
{
	StringResponse res{
		std::piecewise_construct,
		std::make_tuple(text),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "text/plain");
	return res;
}

} // end of namespace cgw
