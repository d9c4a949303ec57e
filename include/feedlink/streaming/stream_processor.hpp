#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "feedlink/result.hpp"
#include "feedlink/streaming/byte_source.hpp"
#include "feedlink/streaming/chunkers.hpp"

namespace feedlink {

    /**
     * @name Folds
     * Combine per-chunk partial results into the running aggregate. A fold
     * exposes `value_type`, `init()` and `operator()(value_type&, Partial)`.
     * @{
     */

    /// @brief Adds partials with `+=`.
    template <typename T>
    struct Sum {
        using value_type = T;
        value_type init() const { return T{}; }
        void operator()(value_type& acc, T part) const { acc += part; }
    };

    /// @brief Appends partial vectors in chunk order.
    template <typename T>
    struct Concat {
        using value_type = std::vector<T>;
        value_type init() const { return {}; }
        void operator()(value_type& acc, std::vector<T> part) const {
            acc.insert(acc.end(), std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
        }
    };

    /// @brief Merges partial maps; a later chunk's value replaces an
    /// earlier one for the same key.
    template <typename K, typename V>
    struct Merge {
        using value_type = std::map<K, V>;
        value_type init() const { return {}; }
        void operator()(value_type& acc, std::map<K, V> part) const {
            for (auto& [k, v] : part) acc.insert_or_assign(k, std::move(v));
        }
    };

    /// @brief Merges partial maps, adding values of equal keys.
    template <typename K, typename V>
    struct KeyedSum {
        using value_type = std::map<K, V>;
        value_type init() const { return {}; }
        void operator()(value_type& acc, std::map<K, V> part) const {
            for (auto& [k, v] : part) acc[k] += v;
        }
    };

    /** @} */

    /// @brief Outcome of validate_records.
    struct ValidationCounts {
        std::size_t valid{0};
        std::size_t invalid{0};
        std::size_t total{0};

        ValidationCounts& operator+=(const ValidationCounts& o) {
            valid += o.valid;
            invalid += o.invalid;
            total += o.total;
            return *this;
        }

        bool operator==(const ValidationCounts&) const = default;
    };

    /**
     * @name Pipeline stages
     * Every stage maps a chunk to a chunk (or, for terminal stages, to a
     * partial result), so stages chain with pipe() and run one chunk at a
     * time with nothing buffered between them.
     * @{
     */

    /// @brief Keep the items of a chunk satisfying @p pred.
    template <typename Pred>
    auto filter(Pred pred) {
        return [pred = std::move(pred)](auto chunk) {
            using Chunk = decltype(chunk);
            Chunk out;
            for (auto& item : chunk) {
                if (pred(item)) out.push_back(std::move(item));
            }
            return out;
        };
    }

    /// @brief Map every item of a chunk through @p fn.
    template <typename Fn>
    auto transform(Fn fn) {
        return [fn = std::move(fn)](auto chunk) {
            using Item = std::decay_t<decltype(fn(std::move(chunk.front())))>;
            std::vector<Item> out;
            out.reserve(chunk.size());
            for (auto& item : chunk) out.push_back(fn(std::move(item)));
            return out;
        };
    }

    /**
     * @brief Terminal stage: per-chunk map of key(item) to the sum of
     * value(item). Pair with KeyedSum to aggregate across chunks.
     */
    template <typename KeyFn, typename ValueFn>
    auto aggregate_by_key(KeyFn key, ValueFn value) {
        return [key = std::move(key), value = std::move(value)](auto chunk) {
            using K = std::decay_t<decltype(key(chunk.front()))>;
            using V = std::decay_t<decltype(value(chunk.front()))>;
            std::map<K, V> out;
            for (const auto& item : chunk) out[key(item)] += value(item);
            return out;
        };
    }

    /// @brief Terminal stage: count items by @p pred. Pair with
    /// Sum<ValidationCounts>.
    template <typename Pred>
    auto validate_records(Pred pred) {
        return [pred = std::move(pred)](const auto& chunk) {
            ValidationCounts c;
            for (const auto& item : chunk) {
                if (pred(item))
                    ++c.valid;
                else
                    ++c.invalid;
            }
            c.total = c.valid + c.invalid;
            return c;
        };
    }

    /// @brief Terminal stage: number of items in a chunk.
    inline auto count_items() {
        return [](const auto& chunk) { return chunk.size(); };
    }

    /// @brief Compose stages left to right.
    template <typename First>
    auto pipe(First first) {
        return first;
    }

    template <typename First, typename Second, typename... Rest>
    auto pipe(First first, Second second, Rest... rest) {
        auto composed = [first = std::move(first),
                         second = std::move(second)](auto chunk) {
            return second(first(std::move(chunk)));
        };
        return pipe(std::move(composed), std::move(rest)...);
    }

    /** @} */

    /**
     * @brief Drives a chunker through a handler and folds the partials.
     *
     * Stateless apart from its configuration: each call owns its source
     * position and accumulator, so one processor may serve concurrent calls
     * on distinct sources.
     *
     * A call is all-or-nothing. Any read, parse or memory-ceiling failure
     * returns the Error and discards the partial aggregate. Peak memory is
     * one chunk plus the read buffer, so results do not depend on
     * chunk_size.
     */
    class StreamingProcessor {
       public:
        explicit StreamingProcessor(StreamConfig config = {})
            : m_config(std::move(config)) {}

        const StreamConfig& config() const noexcept { return m_config; }

        /**
         * @brief Run @p handler over every chunk of @p chunker and fold the
         * results with @p fold.
         */
        template <typename Chunker, typename Handler, typename Fold>
        Result<typename Fold::value_type> run(Chunker& chunker,
                                              const std::string& name,
                                              Handler&& handler,
                                              Fold fold) const {
            using R = Result<typename Fold::value_type>;
            if (auto bad = validate(name)) return R::err(std::move(*bad));

            auto acc = fold.init();
            std::size_t chunks = 0;
            for (;;) {
                auto next = chunker.next();
                if (next.has_error()) {
                    SPDLOG_ERROR("stream {} failed after {} chunks: {}", name,
                                 chunks, next.error().describe());
                    return R::err(std::move(next).error());
                }
                auto& chunk = next.value();
                if (!chunk) break;
                fold(acc, handler(std::move(*chunk)));
                ++chunks;
            }
            SPDLOG_DEBUG("stream {} done: {} chunks", name, chunks);
            return R::ok(std::move(acc));
        }

        /// @brief Byte chunks of chunk_size bytes.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_bytes(ByteSource& source,
                                                        Handler&& handler,
                                                        Fold fold) const {
            ByteChunker chunker(source, m_config);
            return run(chunker, source.name(), std::forward<Handler>(handler),
                       std::move(fold));
        }

        /// @brief Chunks of chunk_size text lines.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_lines(ByteSource& source,
                                                        Handler&& handler,
                                                        Fold fold) const {
            LineChunker chunker(source, m_config);
            return run(chunker, source.name(), std::forward<Handler>(handler),
                       std::move(fold));
        }

        /// @brief Chunks of chunk_size CSV records.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_csv(ByteSource& source,
                                                      Handler&& handler,
                                                      Fold fold) const {
            CsvChunker chunker(source, m_config);
            return run(chunker, source.name(), std::forward<Handler>(handler),
                       std::move(fold));
        }

        /// @brief Chunks of chunk_size JSON-lines documents.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_json_lines(
            ByteSource& source, Handler&& handler, Fold fold) const {
            JsonLinesChunker chunker(source, m_config);
            return run(chunker, source.name(), std::forward<Handler>(handler),
                       std::move(fold));
        }

        /// @brief process_csv over a file; a missing file is an Io error.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_csv_file(
            const std::string& path, Handler&& handler, Fold fold) const {
            using R = Result<typename Fold::value_type>;
            auto file = FileSource::open(path);
            if (file.has_error()) {
                SPDLOG_ERROR("{}", file.error().describe());
                return R::err(std::move(file).error());
            }
            return process_csv(*file.value(), std::forward<Handler>(handler),
                               std::move(fold));
        }

        /// @brief process_json_lines over a file.
        template <typename Handler, typename Fold>
        Result<typename Fold::value_type> process_json_lines_file(
            const std::string& path, Handler&& handler, Fold fold) const {
            using R = Result<typename Fold::value_type>;
            auto file = FileSource::open(path);
            if (file.has_error()) {
                SPDLOG_ERROR("{}", file.error().describe());
                return R::err(std::move(file).error());
            }
            return process_json_lines(*file.value(),
                                      std::forward<Handler>(handler),
                                      std::move(fold));
        }

       private:
        /// @brief InvalidArgument for a zero chunk or buffer size.
        std::optional<Error> validate(const std::string& name) const;

        StreamConfig m_config;
    };

}  // namespace feedlink
