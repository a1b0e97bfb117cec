/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the chunkgate
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#pragma once

#include <boost/format.hpp>

#include <string>
#include <syslog.h>

namespace cgw {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

/// Format a log line with boost::format (i.e. "%1% %2%") and send it to syslog,
/// or the systemd journal if it is available.
template <typename... Args>
void Log(int priority, const std::string& fmt, Args&&... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
