#pragma once

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "feedlink/result.hpp"
#include "feedlink/streaming/byte_source.hpp"

namespace feedlink {

    struct StreamConfig {
        /// @brief Bytes per chunk for ByteChunker, items per chunk for the
        /// line and record chunkers.
        std::size_t chunk_size{1000};
        /// @brief Upper bound on bytes buffered at once (read buffer plus
        /// the chunk being assembled). Exceeding it fails the stream.
        std::optional<std::size_t> max_memory_bytes;
        /// @brief Bytes requested from the source per read.
        std::size_t buffer_size{8192};
        /// @brief CSV only: first record is a header naming the fields.
        bool skip_header{true};
    };

    /// @brief One CSV record keyed by header name (or column position when
    /// the source has no header).
    using CsvRecord = std::map<std::string, std::string>;

    /**
     * @brief Buffered line splitter over a ByteSource.
     *
     * Accepts "\n" and "\r\n" terminators. A final line without terminator
     * is still returned.
     */
    class LineReader {
       public:
        LineReader(ByteSource& source, const StreamConfig& config);

        /// @brief Next line, std::nullopt at end of source.
        Result<std::optional<std::string>> next_line();

        /// @brief Bytes held in the read buffer right now.
        std::size_t buffered() const noexcept { return m_buf.size() - m_pos; }

        /// @brief Fail with Io if @p pending plus the read buffer exceeds
        /// the configured ceiling.
        Result<Unit> check_memory(std::size_t pending) const;

        std::size_t line_number() const noexcept { return m_line; }
        const std::string& source_name() const noexcept { return m_name; }

       private:
        Result<bool> fill();

        ByteSource& m_source;
        StreamConfig m_config;
        std::string m_name;
        std::string m_buf;
        std::size_t m_pos{0};
        std::size_t m_line{0};
        bool m_eof{false};
    };

    /// @brief Error raised for a stream failure at @p where.
    Error stream_error(Error::Code code, const std::string& where,
                       std::string message);

    /*
     * Chunkers produce a lazy, finite, forward-only sequence: each next()
     * returns the following chunk, std::nullopt once the source is drained,
     * or an Error that ends the sequence.
     */

    /// @brief Fixed-size byte chunks; only the last may be shorter.
    class ByteChunker {
       public:
        using chunk_type = std::string;

        ByteChunker(ByteSource& source, const StreamConfig& config);
        Result<std::optional<chunk_type>> next();

       private:
        ByteSource& m_source;
        StreamConfig m_config;
        bool m_eof{false};
    };

    /// @brief chunk_size lines per chunk, terminators stripped.
    class LineChunker {
       public:
        using chunk_type = std::vector<std::string>;

        LineChunker(ByteSource& source, const StreamConfig& config)
            : m_reader(source, config), m_config(config) {}
        Result<std::optional<chunk_type>> next();

       private:
        LineReader m_reader;
        StreamConfig m_config;
    };

    /**
     * @brief chunk_size CSV records per chunk (RFC 4180 quoting, quoted
     * fields may span lines). With skip_header the first record names the
     * fields; otherwise fields are keyed "0", "1", ...
     * Records with more fields than the header fail with Parse; records
     * with fewer leave the missing fields absent.
     */
    class CsvChunker {
       public:
        using chunk_type = std::vector<CsvRecord>;

        CsvChunker(ByteSource& source, const StreamConfig& config)
            : m_reader(source, config), m_config(config) {}
        Result<std::optional<chunk_type>> next();

        /// @brief Header fields, empty until the first chunk was requested.
        const std::vector<std::string>& header() const noexcept {
            return m_header;
        }

       private:
        Result<std::optional<std::vector<std::string>>> next_fields();

        LineReader m_reader;
        StreamConfig m_config;
        std::vector<std::string> m_header;
        bool m_header_read{false};
    };

    /// @brief chunk_size JSON documents per chunk, one per line. Blank
    /// lines are skipped; a malformed line fails with Parse.
    class JsonLinesChunker {
       public:
        using chunk_type = std::vector<nlohmann::json>;

        JsonLinesChunker(ByteSource& source, const StreamConfig& config)
            : m_reader(source, config), m_config(config) {}
        Result<std::optional<chunk_type>> next();

       private:
        LineReader m_reader;
        StreamConfig m_config;
    };

    /// @brief Split one complete CSV record into fields.
    /// Returns false if a quoted field is left open.
    bool split_csv_fields(const std::string& record,
                          std::vector<std::string>& out);

}  // namespace feedlink
