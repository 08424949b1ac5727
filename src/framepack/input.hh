//
// Thin checked wrappers over std::istream / std::ostream used by the codecs.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <framepack/exceptions.hh>

namespace framepack {

    // Reader over a seekable input stream - throws on error
    class reader {
        public:
            explicit reader(std::istream& is);

            // Reads up to size bytes, returns the number actually read
            std::size_t read(void* dst, std::size_t size);

            // Reads exactly size bytes, unexpected_eof otherwise
            std::vector<std::byte> read_exact(std::size_t size, const char* what);

            // Reads one line without its terminator (a trailing '\r' is dropped),
            // nullopt if the stream is already at its end
            std::optional<std::string> read_line();

            // Advances past size bytes that must exist in the stream
            void skip(std::uint64_t size);

            // unexpected_eof unless size more bytes follow the current position
            void ensure_available(std::uint64_t size, const char* what);

            [[nodiscard]] std::uint64_t tell() const;
            [[nodiscard]] std::uint64_t size() const;
            [[nodiscard]] bool at_end() const;

            std::istream& get_stream() { return m_stream; }

        private:
            std::istream& m_stream;
    };

    // Writer over an output stream - throws on error
    class writer {
        public:
            explicit writer(std::ostream& os);

            void write(const void* src, std::size_t size);
            void write(const std::string& str) { write(str.data(), str.size()); }
            void flush();

        private:
            std::ostream& m_stream;
    };
}
