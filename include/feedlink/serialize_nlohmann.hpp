#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "feedlink/response.hpp"
#include "feedlink/result.hpp"
#include "feedlink/serialize_impl.hpp"

namespace feedlink {

    /// @brief Parse a body into a JSON document without throwing.
    inline Result<nlohmann::json> parse_json(std::string_view body) {
        auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                       /*allow_exceptions=*/false);
        if (j.is_discarded()) {
            return Result<nlohmann::json>::err(Error::Code::Parse,
                                               "body is not valid JSON");
        }
        return Result<nlohmann::json>::ok(std::move(j));
    }

    // Overload for types adaptable to nlohmann::json
    template <typename T>
    Result<Unit> deserialize(const Response& response, T& out) {
        auto j = parse_json(response.body);
        if (j.has_error()) return Result<Unit>::err(std::move(j).error());
        try {
            j.value().get_to(out);
        } catch (const nlohmann::json::exception& e) {
            return Result<Unit>::err(Error::Code::Parse, e.what());
        }
        return Result<Unit>::ok();
    }

}  // namespace feedlink
