#include "feedlink/streaming/chunkers.hpp"

#include <algorithm>

#include "feedlink/streaming/stream_processor.hpp"

namespace feedlink {

    Error stream_error(Error::Code code, const std::string& where,
                       std::string message) {
        Error e{code, where + ": " + std::move(message)};
        return e;
    }

    namespace {

        /// @brief Rough footprint of a chunk item, for the memory ceiling.
        std::size_t footprint(const std::string& s) { return s.size(); }

        std::size_t footprint(const std::vector<std::string>& fields) {
            std::size_t n = 0;
            for (const auto& f : fields) n += f.size();
            return n;
        }

        bool quote_open(const std::string& text) {
            return std::count(text.begin(), text.end(), '"') % 2 != 0;
        }

    }  // namespace

    LineReader::LineReader(ByteSource& source, const StreamConfig& config)
        : m_source(source), m_config(config), m_name(source.name()) {}

    Result<Unit> LineReader::check_memory(std::size_t pending) const {
        if (!m_config.max_memory_bytes) return Result<Unit>::ok();
        const std::size_t used = pending + m_buf.size();
        if (used <= *m_config.max_memory_bytes) return Result<Unit>::ok();
        return Result<Unit>::err(stream_error(
            Error::Code::Io, m_name,
            "memory ceiling of " + std::to_string(*m_config.max_memory_bytes) +
                " bytes exceeded (" + std::to_string(used) + " buffered)"));
    }

    Result<bool> LineReader::fill() {
        if (m_eof) return Result<bool>::ok(false);

        // Compact consumed bytes before growing
        if (m_pos > 0) {
            m_buf.erase(0, m_pos);
            m_pos = 0;
        }

        const std::size_t old = m_buf.size();
        m_buf.resize(old + m_config.buffer_size);
        auto got = m_source.read(m_buf.data() + old, m_config.buffer_size);
        if (got.has_error()) {
            m_buf.resize(old);
            Error e = std::move(got).error();
            if (e.code != Error::Code::Io) {
                e = stream_error(Error::Code::Io, m_name, e.message);
            }
            return Result<bool>::err(std::move(e));
        }
        m_buf.resize(old + got.value());
        if (got.value() == 0) {
            m_eof = true;
            return Result<bool>::ok(false);
        }
        return Result<bool>::ok(true);
    }

    Result<std::optional<std::string>> LineReader::next_line() {
        using R = Result<std::optional<std::string>>;
        for (;;) {
            const auto nl = m_buf.find('\n', m_pos);
            if (nl != std::string::npos) {
                std::size_t end = nl;
                if (end > m_pos && m_buf[end - 1] == '\r') --end;
                std::string line = m_buf.substr(m_pos, end - m_pos);
                m_pos = nl + 1;
                ++m_line;
                return R::ok(std::move(line));
            }

            auto more = fill();
            if (more.has_error()) return R::err(std::move(more).error());
            if (auto mem = check_memory(0); mem.has_error())
                return R::err(std::move(mem).error());

            if (!more.value()) {
                if (m_pos >= m_buf.size()) return R::ok(std::nullopt);
                // Unterminated last line
                std::string line = m_buf.substr(m_pos);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_pos = m_buf.size();
                ++m_line;
                return R::ok(std::move(line));
            }
        }
    }

    ByteChunker::ByteChunker(ByteSource& source, const StreamConfig& config)
        : m_source(source), m_config(config) {}

    Result<std::optional<std::string>> ByteChunker::next() {
        using R = Result<std::optional<std::string>>;
        if (m_eof) return R::ok(std::nullopt);

        if (m_config.max_memory_bytes &&
            m_config.chunk_size > *m_config.max_memory_bytes) {
            return R::err(stream_error(
                Error::Code::Io, m_source.name(),
                "chunk of " + std::to_string(m_config.chunk_size) +
                    " bytes exceeds memory ceiling of " +
                    std::to_string(*m_config.max_memory_bytes)));
        }

        std::string chunk(m_config.chunk_size, '\0');
        std::size_t filled = 0;
        while (filled < chunk.size()) {
            auto got = m_source.read(chunk.data() + filled,
                                     std::min(m_config.buffer_size,
                                              chunk.size() - filled));
            if (got.has_error()) {
                Error e = std::move(got).error();
                if (e.code != Error::Code::Io)
                    e = stream_error(Error::Code::Io, m_source.name(), e.message);
                return R::err(std::move(e));
            }
            if (got.value() == 0) {
                m_eof = true;
                break;
            }
            filled += got.value();
        }

        if (filled == 0) return R::ok(std::nullopt);
        chunk.resize(filled);
        return R::ok(std::move(chunk));
    }

    Result<std::optional<LineChunker::chunk_type>> LineChunker::next() {
        using R = Result<std::optional<chunk_type>>;
        chunk_type chunk;
        std::size_t bytes = 0;
        while (chunk.size() < m_config.chunk_size) {
            auto line = m_reader.next_line();
            if (line.has_error()) return R::err(std::move(line).error());
            if (!line.value()) break;

            bytes += footprint(*line.value());
            if (auto mem = m_reader.check_memory(bytes); mem.has_error())
                return R::err(std::move(mem).error());
            chunk.push_back(std::move(*line.value()));
        }
        if (chunk.empty()) return R::ok(std::nullopt);
        return R::ok(std::move(chunk));
    }

    bool split_csv_fields(const std::string& record,
                          std::vector<std::string>& out) {
        out.clear();
        std::string field;
        bool in_quotes = false;
        for (std::size_t i = 0; i < record.size(); ++i) {
            const char c = record[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < record.size() && record[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                out.push_back(std::move(field));
                field.clear();
            } else {
                field.push_back(c);
            }
        }
        out.push_back(std::move(field));
        return !in_quotes;
    }

    Result<std::optional<std::vector<std::string>>> CsvChunker::next_fields() {
        using R = Result<std::optional<std::vector<std::string>>>;
        for (;;) {
            auto line = m_reader.next_line();
            if (line.has_error()) return R::err(std::move(line).error());
            if (!line.value()) return R::ok(std::nullopt);

            std::string record = std::move(*line.value());
            if (record.empty()) continue;

            const std::size_t first_line = m_reader.line_number();
            while (quote_open(record)) {
                auto cont = m_reader.next_line();
                if (cont.has_error()) return R::err(std::move(cont).error());
                if (!cont.value()) {
                    return R::err(stream_error(
                        Error::Code::Parse, m_reader.source_name(),
                        "unterminated quoted field starting on line " +
                            std::to_string(first_line)));
                }
                record += '\n';
                record += *cont.value();
                if (auto mem = m_reader.check_memory(record.size());
                    mem.has_error())
                    return R::err(std::move(mem).error());
            }

            std::vector<std::string> fields;
            if (!split_csv_fields(record, fields)) {
                return R::err(stream_error(
                    Error::Code::Parse, m_reader.source_name(),
                    "malformed record on line " + std::to_string(first_line)));
            }
            return R::ok(std::move(fields));
        }
    }

    Result<std::optional<CsvChunker::chunk_type>> CsvChunker::next() {
        using R = Result<std::optional<chunk_type>>;

        if (!m_header_read) {
            m_header_read = true;
            if (m_config.skip_header) {
                auto header = next_fields();
                if (header.has_error()) return R::err(std::move(header).error());
                if (!header.value()) return R::ok(std::nullopt);
                m_header = std::move(*header.value());
            }
        }

        chunk_type chunk;
        std::size_t bytes = 0;
        while (chunk.size() < m_config.chunk_size) {
            auto fields = next_fields();
            if (fields.has_error()) return R::err(std::move(fields).error());
            if (!fields.value()) break;

            auto& values = *fields.value();
            if (!m_header.empty() && values.size() > m_header.size()) {
                return R::err(stream_error(
                    Error::Code::Parse, m_reader.source_name(),
                    "line " + std::to_string(m_reader.line_number()) + " has " +
                        std::to_string(values.size()) + " fields, header has " +
                        std::to_string(m_header.size())));
            }

            bytes += footprint(values);
            if (auto mem = m_reader.check_memory(bytes); mem.has_error())
                return R::err(std::move(mem).error());

            CsvRecord rec;
            for (std::size_t i = 0; i < values.size(); ++i) {
                std::string key =
                    m_header.empty() ? std::to_string(i) : m_header[i];
                rec.emplace(std::move(key), std::move(values[i]));
            }
            chunk.push_back(std::move(rec));
        }

        if (chunk.empty()) return R::ok(std::nullopt);
        return R::ok(std::move(chunk));
    }

    Result<std::optional<JsonLinesChunker::chunk_type>> JsonLinesChunker::next() {
        using R = Result<std::optional<chunk_type>>;
        chunk_type chunk;
        std::size_t bytes = 0;
        while (chunk.size() < m_config.chunk_size) {
            auto line = m_reader.next_line();
            if (line.has_error()) return R::err(std::move(line).error());
            if (!line.value()) break;

            const std::string& text = *line.value();
            if (text.find_first_not_of(" \t") == std::string::npos) continue;

            auto doc = nlohmann::json::parse(text, nullptr, false);
            if (doc.is_discarded()) {
                return R::err(stream_error(
                    Error::Code::Parse, m_reader.source_name(),
                    "invalid JSON on line " +
                        std::to_string(m_reader.line_number())));
            }

            bytes += text.size();
            if (auto mem = m_reader.check_memory(bytes); mem.has_error())
                return R::err(std::move(mem).error());
            chunk.push_back(std::move(doc));
        }

        if (chunk.empty()) return R::ok(std::nullopt);
        return R::ok(std::move(chunk));
    }

    std::optional<Error> StreamingProcessor::validate(
        const std::string& name) const {
        if (m_config.chunk_size == 0) {
            return stream_error(Error::Code::InvalidArgument, name,
                                "chunk_size must be positive");
        }
        if (m_config.buffer_size == 0) {
            return stream_error(Error::Code::InvalidArgument, name,
                                "buffer_size must be positive");
        }
        return std::nullopt;
    }

}  // namespace feedlink
