//
// Thin checked wrappers over std::istream / std::ostream used by the codecs.
//

#include <istream>
#include <ostream>
#include <string>

#include "input.hh"

namespace framepack {
    // reader implementation
    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        return bytes_read;
    }

    std::vector<std::byte> reader::read_exact(std::size_t size, const char* what) {
        std::vector<std::byte> buffer(size);
        if (size == 0) {
            return buffer;
        }
        std::size_t actual = read(buffer.data(), size);
        THROW_EOF_IF(actual != size, "Unexpected end of pack reading ", what,
                     ": requested ", size, " bytes, got ", actual);
        return buffer;
    }

    std::optional<std::string> reader::read_line() {
        if (!m_stream.good()) {
            return std::nullopt;
        }

        std::string line;
        std::getline(m_stream, line);
        THROW_IO_IF(m_stream.bad(), "Stream read failed");

        // getline on an exhausted stream extracts nothing and sets failbit
        if (m_stream.fail() && line.empty()) {
            return std::nullopt;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    void reader::skip(std::uint64_t size) {
        if (size == 0) {
            return;
        }

        ensure_available(size, "skipped block");
        std::uint64_t current = tell();

        m_stream.seekg(static_cast<std::streamoff>(size), std::ios_base::cur);
        THROW_IO_IF(m_stream.fail(), "Cannot seek to offset ", current + size);
    }

    void reader::ensure_available(std::uint64_t size, const char* what) {
        std::uint64_t current = tell();
        std::uint64_t total = this->size();
        THROW_EOF_IF(current > total || size > total - current, "Unexpected end of pack reading ", what,
                     ": ", size, " bytes needed at offset ", current, ", stream size is only ", total, " bytes");
    }

    std::uint64_t reader::tell() const {
        std::streampos pos = const_cast<std::istream&>(m_stream).tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t reader::size() const {
        auto& stream = const_cast<std::istream&>(m_stream);

        // Save current position
        std::streampos current_pos = stream.tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in size()");

        // Seek to end to get size
        stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = stream.tellg();

        // Restore original position
        stream.seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }

    bool reader::at_end() const {
        auto& stream = const_cast<std::istream&>(m_stream);
        if (!stream.good()) {
            return true;
        }
        return stream.peek() == std::istream::traits_type::eof();
    }

    // writer implementation
    writer::writer(std::ostream& os) : m_stream(os) {}

    void writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_UNLESS(src, "Null buffer in write");
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.write(static_cast<const char*>(src), static_cast<std::streamsize>(size));
        THROW_IO_IF(m_stream.fail(), "Failed to write ", size, " bytes");
    }

    void writer::flush() {
        m_stream.flush();
        THROW_IO_IF(m_stream.fail(), "Failed to flush stream");
    }
}
