//
// zlib helpers for binary blocks.
//

#include <zlib.h>

#include <algorithm>
#include <limits>

#include <framepack/exceptions.hh>
#include "deflate.hh"

namespace framepack::deflate {

    std::vector<std::byte> compress(const void* data, std::size_t size, int level) {
        THROW_LIMIT_IF(size > std::numeric_limits<uLong>::max(), block_too_large,
                       "Block of ", size, " bytes is too large for zlib");

        uLongf bound = compressBound(static_cast<uLong>(size));
        std::vector<std::byte> output(bound);

        // zlib rejects a null source even for empty input
        static const Bytef empty = 0;
        const Bytef* source = size > 0 ? static_cast<const Bytef*>(data) : &empty;

        int rc = compress2(reinterpret_cast<Bytef*>(output.data()), &bound, source, static_cast<uLong>(size), level);
        THROW_IO_IF(rc != Z_OK, "zlib compression failed with error ", rc);

        output.resize(bound);
        return output;
    }

    std::vector<std::byte> uncompress(const void* data, std::size_t size, std::size_t max_output) {
        THROW_FORMAT_IF(size == 0, corrupt_block, "Empty compressed block");

        z_stream zs{};
        int rc = inflateInit(&zs);
        THROW_IO_IF(rc != Z_OK, "zlib initialisation failed with error ", rc);

        struct inflate_guard {
            z_stream* s;
            ~inflate_guard() { inflateEnd(s); }
        } guard{&zs};

        std::vector<std::byte> output;
        std::size_t chunk = std::clamp<std::size_t>(size * 4, 4096, std::size_t(1) << 30);

        zs.next_in = const_cast<Bytef*>(static_cast<const Bytef*>(data));
        std::size_t remaining_in = size;

        do {
            if (zs.avail_in == 0 && remaining_in > 0) {
                auto take = std::min<std::size_t>(remaining_in, std::numeric_limits<uInt>::max());
                zs.avail_in = static_cast<uInt>(take);
                remaining_in -= take;
            }

            // One byte past the limit is enough to detect an oversized block
            std::size_t used = output.size();
            std::size_t room = max_output - used;
            std::size_t step = room < chunk ? room + 1 : chunk;
            output.resize(used + step);
            zs.next_out = reinterpret_cast<Bytef*>(output.data() + used);
            zs.avail_out = static_cast<uInt>(step);

            rc = inflate(&zs, Z_NO_FLUSH);
            output.resize(used + (step - zs.avail_out));

            THROW_FORMAT_IF(output.size() > max_output, corrupt_block,
                            "Compressed block expands past the limit of ", max_output, " bytes");

            THROW_FORMAT_IF(rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_STREAM_ERROR, corrupt_block,
                            "Compressed block is damaged: ", zs.msg ? zs.msg : "zlib data error");
            THROW_IO_IF(rc == Z_MEM_ERROR, "zlib ran out of memory");
            THROW_FORMAT_IF(rc == Z_BUF_ERROR && zs.avail_in == 0 && remaining_in == 0, corrupt_block,
                            "Compressed block is truncated");
        } while (rc != Z_STREAM_END);

        THROW_FORMAT_IF(zs.avail_in != 0 || remaining_in != 0, corrupt_block,
                        "Unexpected bytes after the end of the compressed block");

        return output;
    }
}
