//
// Pack file header.
//

#include <istream>
#include <ostream>
#include <string>

#include <framepack/header.hh>
#include <framepack/exceptions.hh>
#include "input.hh"

namespace framepack {

    void write_header(std::ostream& os, pack_mode mode) {
        std::string header(pack_magic);
        header += mode_char(mode);

        writer w(os);
        w.write(header);
    }

    pack_mode read_header(std::istream& is, std::optional<pack_mode> expected) {
        std::string header(pack_header_size, '\0');
        reader r(is);
        std::size_t actual = r.read(header.data(), header.size());

        THROW_FORMAT_IF(actual != header.size(), header_mismatch,
                        "File is too short for a pack header: got ", actual, " of ", pack_header_size, " bytes");

        THROW_FORMAT_UNLESS(std::string_view(header).substr(0, pack_magic.size()) == pack_magic, header_mismatch,
                            "Header does not start with '", pack_magic, "'");

        char stored = header.back();
        THROW_FORMAT_UNLESS(stored == 'B' || stored == 'T', header_mismatch,
                            "Unknown pack mode character '", stored, "'");

        pack_mode mode = stored == 'B' ? pack_mode::binary : pack_mode::text;
        THROW_FORMAT_IF(expected && *expected != mode, header_mismatch,
                        "Pack is in ", mode_name(mode), " mode but ", mode_name(*expected), " was expected");

        return mode;
    }

} // namespace framepack
