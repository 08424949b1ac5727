//
// MIME type detection through libmagic.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace framepack::mime {

    inline constexpr const char* fallback_type = "application/octet-stream";

    // Type such as "text/plain", nullopt if libmagic cannot tell
    std::optional<std::string> detect(const std::filesystem::path& path);
}
