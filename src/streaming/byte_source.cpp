#include "feedlink/streaming/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace feedlink {

    Result<std::unique_ptr<FileSource>> FileSource::open(
        const std::string& path) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            Error e{Error::Code::Io,
                    "cannot open " + path + ": " + std::strerror(errno)};
            return Result<std::unique_ptr<FileSource>>::err(std::move(e));
        }
        return Result<std::unique_ptr<FileSource>>::ok(
            std::make_unique<FileSource>(OpenTag{}, std::move(in), path));
    }

    Result<std::size_t> FileSource::read(char* dst, std::size_t n) {
        if (n == 0 || m_in.eof()) return Result<std::size_t>::ok(std::size_t{0});

        m_in.read(dst, static_cast<std::streamsize>(n));
        const auto got = static_cast<std::size_t>(m_in.gcount());
        if (m_in.bad()) {
            return Result<std::size_t>::err(Error::Code::Io,
                                            "read failed on " + m_path);
        }
        return Result<std::size_t>::ok(got);
    }

    Result<std::size_t> MemorySource::read(char* dst, std::size_t n) {
        const std::size_t take = std::min(n, m_data.size() - m_pos);
        std::memcpy(dst, m_data.data() + m_pos, take);
        m_pos += take;
        return Result<std::size_t>::ok(take);
    }

    Result<std::size_t> ResponseBodySource::read(char* dst, std::size_t n) {
        auto got = m_body.read(dst, n);
        if (got.has_value()) return got;

        Error e = std::move(got).error();
        Error io{Error::Code::Io,
                 "body read failed on " + m_name + ": " + e.message};
        io.origin = std::move(e.origin);
        io.cause = e.code;
        return Result<std::size_t>::err(std::move(io));
    }

    Result<std::unique_ptr<ByteSource>> open_http_source(PooledClient& client,
                                                         std::string path,
                                                         QueryParams query,
                                                         Headers headers) {
        std::string name = client.origin().to_string() + path;
        auto body = client.open_stream(std::move(path), std::move(query),
                                       std::move(headers));
        if (body.has_error()) {
            return Result<std::unique_ptr<ByteSource>>::err(
                std::move(body).error());
        }
        return Result<std::unique_ptr<ByteSource>>::ok(
            std::make_unique<ResponseBodySource>(std::move(body).value(),
                                                 std::move(name)));
    }

}  // namespace feedlink
