#include <ffdl/result.hpp>
#include <string>

namespace ffdl {

struct ffdl_error_category : std::error_category {
	const char *name() const noexcept override { return "ffdl"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "HTTP error";
			case errc::timeout: return "Request timed out";
			case errc::too_many_redirects: return "Too many redirects";
			case errc::aborted: return "Request aborted";
			case errc::invalid_url: return "Invalid URL";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::no_filename:
				return "Could not determine a filename from the link/page";
			case errc::no_download_url:
				return "No direct download URL found on the page";
			case errc::range_not_honored:
				return "Server ignored the byte range request";
			case errc::incomplete_chunk: return "Chunk body length mismatch";
			case errc::incomplete_transfer:
				return "One or more chunks failed permanently";
			case errc::cancelled: return "Cancelled";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ffdl_category() {
	static ffdl_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ffdl_category()};
}

bool is_network_error(const std::error_code &ec) {
	if (ec.category() != ffdl_category()) return false;
	switch (static_cast<errc>(ec.value())) {
		case errc::request_failed:
		case errc::http_error:
		case errc::timeout:
		case errc::too_many_redirects:
		case errc::range_not_honored:
		case errc::incomplete_chunk: return true;
		default: return false;
	}
}

}  // namespace ffdl
