/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.

    Copyright (C) 1998 - 2017, Daniel Stenberg, <daniel@haxx.se>, et al.
*/

#include "Escape.hh"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>

#include <algorithm>

namespace {

// Copied from libcurl
// See https://tools.ietf.org/html/rfc3986#section-2.3
bool is_unreserved(unsigned char in)
{
	switch (in)
	{
		case '0': case '1': case '2': case '3': case '4':
		case '5': case '6': case '7': case '8': case '9':
		case 'a': case 'b': case 'c': case 'd': case 'e':
		case 'f': case 'g': case 'h': case 'i': case 'j':
		case 'k': case 'l': case 'm': case 'n': case 'o':
		case 'p': case 'q': case 'r': case 's': case 't':
		case 'u': case 'v': case 'w': case 'x': case 'y': case 'z':
		case 'A': case 'B': case 'C': case 'D': case 'E':
		case 'F': case 'G': case 'H': case 'I': case 'J':
		case 'K': case 'L': case 'M': case 'N': case 'O':
		case 'P': case 'Q': case 'R': case 'S': case 'T':
		case 'U': case 'V': case 'W': case 'X': case 'Y': case 'Z':
		case '-': case '.': case '_': case '~':
			return true;
		default:
			break;
	}
	return false;
}

bool is_base64(char c)
{
	return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

using namespace boost::archive::iterators;
using ToBase64   = base64_from_binary<transform_width<std::string_view::const_iterator, 6, 8>>;
using FromBase64 = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

// Expects a string with only base64 alphabets and no padding
std::optional<std::string> decode_unpadded(std::string text)
{
	// a single character carries only 6 bits: not even one byte
	if (text.size() % 4 == 1)
		return std::nullopt;

	auto pad = (4 - text.size() % 4) % 4;
	text.append(pad, 'A');

	try
	{
		std::string result{FromBase64{text.cbegin()}, FromBase64{text.cend()}};
		result.resize(result.size() - pad);
		return result;
	}
	catch (dataflow_exception&)
	{
		return std::nullopt;
	}
}

std::optional<char> hex_digit(char c)
{
	if      ( c >= '0' && c <= '9' ) return c - '0';
	else if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
	else if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
	else return std::nullopt;
}

std::optional<char> from_hex(char msb, char lsb)
{
	auto big = hex_digit(msb);
	auto sml = hex_digit(lsb);
	if (big && sml)
		return static_cast<char>(*big * 16 + *sml);
	else
		return std::nullopt;
}

} // end of local namespace

namespace cgw {

std::string url_encode(std::string_view in)
{
	static const char hex[] = "0123456789ABCDEF";

	std::string result;
	for (unsigned char c : in)
	{
		if (is_unreserved(c))
			result.push_back(static_cast<char>(c));
		else
		{
			result.push_back('%');
			result.push_back(hex[c >> 4]);
			result.push_back(hex[c & 0xf]);
		}
	}
	return result;
}

std::string url_decode(std::string_view in)
{
	std::string result;
	while (!in.empty())
	{
		if (in.front() != '%')
		{
			result.push_back(in.front());
			in.remove_prefix(1);
		}
		else if (in.size() >= 3)
		{
			auto ch = from_hex(in[1], in[2]);
			if (!ch)
				break;

			result.push_back(*ch);
			in.remove_prefix(3);
		}
		else
			break;
	}
	return result;
}

std::string html_escape(std::string_view in)
{
	std::string result;
	for (auto c : in)
	{
		switch (c)
		{
			case '&':  result.append("&amp;");  break;
			case '<':  result.append("&lt;");   break;
			case '>':  result.append("&gt;");   break;
			case '\"': result.append("&quot;"); break;
			case '\'': result.append("&#39;");  break;
			default:   result.push_back(c);     break;
		}
	}
	return result;
}

std::string base64url_encode(std::string_view bin)
{
	std::string result{ToBase64{bin.begin()}, ToBase64{bin.end()}};
	std::replace(result.begin(), result.end(), '+', '-');
	std::replace(result.begin(), result.end(), '/', '_');
	return result;
}

std::optional<std::string> base64url_decode(std::string_view text)
{
	std::string std_alphabet{text};
	for (auto& c : std_alphabet)
	{
		if (c == '-')
			c = '+';
		else if (c == '_')
			c = '/';
		else if (c == '+' || c == '/' || !is_base64(c))
			return std::nullopt;
	}
	return decode_unpadded(std::move(std_alphabet));
}

std::optional<std::string> base64_decode(std::string_view text)
{
	if (text.size() % 4 != 0)
		return std::nullopt;

	while (!text.empty() && text.back() == '=')
		text.remove_suffix(1);

	if (!std::all_of(text.begin(), text.end(), is_base64))
		return std::nullopt;

	return decode_unpadded(std::string{text});
}

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value)
{
	// substr() will not throw even if "in" is empty and location==npos
	auto location = in.find_first_of(value);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching character, if any
	char match = '\0';
	if (location != in.npos)
	{
		match = in.front();
		in.remove_prefix(1);
	}

	return std::make_tuple(result, match);
}

std::string_view split_front_substring(std::string_view& in, std::string_view substring)
{
	// substr() will not throw even if "in" is empty and location==npos
	auto location = in.find(substring);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching substring, if any
	if (location != in.npos)
		in.remove_prefix(substring.size());

	return result;
}

} // end of cgw namespace
