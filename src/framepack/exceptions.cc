//
// Names for error kinds.
//

#include <framepack/exceptions.hh>

namespace framepack {

    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::header_mismatch:   return "header_mismatch";
            case error_kind::unsupported_size:  return "unsupported_size";
            case error_kind::block_too_large:   return "block_too_large";
            case error_kind::corrupt_block:     return "corrupt_block";
            case error_kind::checksum_mismatch: return "checksum_mismatch";
            case error_kind::io_error:          return "io_error";
            case error_kind::corrupt_metadata:  return "corrupt_metadata";
            case error_kind::size_mismatch:     return "size_mismatch";
            case error_kind::unexpected_eof:    return "unexpected_eof";
            case error_kind::block_not_found:   return "block_not_found";
            case error_kind::invalid_state:     return "invalid_state";
            case error_kind::invalid_argument:  return "invalid_argument";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace framepack
