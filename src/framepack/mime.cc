//
// MIME type detection through libmagic.
//

#include <magic.h>

#include <memory>
#include <type_traits>

#include "mime.hh"

namespace framepack::mime {

    namespace {
        struct magic_deleter {
            void operator()(magic_t cookie) const { magic_close(cookie); }
        };
        using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, magic_deleter>;
    }

    std::optional<std::string> detect(const std::filesystem::path& path) {
        unique_magic cookie(magic_open(MAGIC_MIME_TYPE));
        if (!cookie) {
            return std::nullopt;
        }

        // nullptr loads the default magic database
        if (magic_load(cookie.get(), nullptr) != 0) {
            return std::nullopt;
        }

        const char* type = magic_file(cookie.get(), path.c_str());
        if (!type || *type == '\0') {
            return std::nullopt;
        }
        return std::string(type);
    }
}
