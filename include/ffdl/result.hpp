#pragma once

#include <ffdl/ffdl_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace ffdl {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Non-2xx status
	timeout,
	too_many_redirects,
	aborted,  // Body or header sink asked to stop

	// Parsing errors
	invalid_url = 20,
	invalid_number_format,

	// Resolution
	no_filename = 30,
	no_download_url,

	// Transfer
	range_not_honored = 40,
	incomplete_chunk,
	incomplete_transfer,
	cancelled,

	// I/O
	file_open_failed = 50,
	file_write_failed,

	unknown = 100
};

FFDL_EXPORT const std::error_category &ffdl_category();
FFDL_EXPORT std::error_code make_error_code(errc e);

/// True for errors caused by the network or the remote server.
FFDL_EXPORT bool is_network_error(const std::error_code &ec);

}  // namespace ffdl

namespace std {
template <>
struct is_error_code_enum<ffdl::errc> : true_type {};
}  // namespace std

namespace ffdl {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ffdl
