#pragma once

#include <cstddef>
#include <fstream>
#include <memory>
#include <string>

#include "feedlink/client.hpp"
#include "feedlink/result.hpp"

namespace feedlink {

    /**
     * @brief Forward-only byte producer consumed by the stream chunkers.
     *
     * A source is read once; it cannot be rewound. Read failures are
     * reported as Error::Code::Io.
     */
    class ByteSource {
       public:
        virtual ~ByteSource() = default;

        /// @brief Read up to @p n bytes into @p dst; 0 means end of source.
        virtual Result<std::size_t> read(char* dst, std::size_t n) = 0;

        /// @brief Human readable name used in errors and logs.
        virtual std::string name() const = 0;
    };

    /// @brief A local file opened for binary reading.
    class FileSource final : public ByteSource {
       public:
        /// @brief Open @p path. A missing or unreadable file is an Io error.
        static Result<std::unique_ptr<FileSource>> open(const std::string& path);

       private:
        struct OpenTag {
            explicit OpenTag() = default;
        };

       public:
        /// @brief Only reachable through open().
        FileSource(OpenTag, std::ifstream in, std::string path)
            : m_in(std::move(in)), m_path(std::move(path)) {}

        Result<std::size_t> read(char* dst, std::size_t n) override;
        std::string name() const override { return m_path; }

       private:

        std::ifstream m_in;
        std::string m_path;
    };

    /// @brief An in-memory buffer, mostly useful for small payloads and
    /// tests.
    class MemorySource final : public ByteSource {
       public:
        explicit MemorySource(std::string data, std::string name = "memory")
            : m_data(std::move(data)), m_name(std::move(name)) {}

        Result<std::size_t> read(char* dst, std::size_t n) override;
        std::string name() const override { return m_name; }

       private:
        std::string m_data;
        std::size_t m_pos{0};
        std::string m_name;
    };

    /// @brief Response body pulled from the socket as it is consumed.
    /// Transport failures mid-body surface as Io with the transport code in
    /// Error::cause.
    class ResponseBodySource final : public ByteSource {
       public:
        explicit ResponseBodySource(BodyStream body, std::string name)
            : m_body(std::move(body)), m_name(std::move(name)) {}

        Result<std::size_t> read(char* dst, std::size_t n) override;
        std::string name() const override { return m_name; }

        const ResponseHead& head() const noexcept { return m_body.head(); }

       private:
        BodyStream m_body;
        std::string m_name;
    };

    /**
     * @brief Open a GET through @p client whose body feeds a stream.
     *
     * Admission, retry and breaker accounting apply up to the response
     * headers, exactly as for PooledClient::get.
     */
    Result<std::unique_ptr<ByteSource>> open_http_source(
        PooledClient& client, std::string path, QueryParams query = {},
        Headers headers = {});

}  // namespace feedlink
