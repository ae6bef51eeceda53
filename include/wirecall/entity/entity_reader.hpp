#pragma once

#include "wirecall/core/message.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace wirecall {

// ─────────────────────────────────────────────────────────────────────────────
// Entity Readers
// ─────────────────────────────────────────────────────────────────────────────
// Read a response entity as a target shape. Errors are plain messages; the
// dispatcher wraps them into ResponseProcessing errors that carry the
// response.
//
// std::string and byte vectors are read verbatim, Json is parsed, and any
// other type goes through nlohmann's from_json.

template <typename T>
struct EntityReader;

template <>
struct EntityReader<std::string> {
    static tl::expected<std::string, std::string> read(InboundResponse& response) {
        auto text = response.read_text();
        if (!text) {
            return tl::unexpected(std::format("Reading entity failed: {}", text.error().message));
        }
        return std::move(*text);
    }
};

template <>
struct EntityReader<std::vector<std::uint8_t>> {
    static tl::expected<std::vector<std::uint8_t>, std::string> read(InboundResponse& response) {
        auto text = EntityReader<std::string>::read(response);
        if (!text) {
            return tl::unexpected(text.error());
        }
        return std::vector<std::uint8_t>(text->begin(), text->end());
    }
};

template <>
struct EntityReader<Json> {
    static tl::expected<Json, std::string> read(InboundResponse& response) {
        auto text = EntityReader<std::string>::read(response);
        if (!text) {
            return tl::unexpected(text.error());
        }
        try {
            return Json::parse(*text);
        } catch (const Json::parse_error& e) {
            return tl::unexpected(std::format("Entity is not valid JSON: {}", e.what()));
        }
    }
};

template <typename T>
struct EntityReader {
    static tl::expected<T, std::string> read(InboundResponse& response) {
        auto document = EntityReader<Json>::read(response);
        if (!document) {
            return tl::unexpected(document.error());
        }
        try {
            return document->template get<T>();
        } catch (const Json::exception& e) {
            return tl::unexpected(std::format("Entity does not match target type: {}", e.what()));
        }
    }
};

template <typename T>
[[nodiscard]] tl::expected<T, std::string> read_entity(InboundResponse& response) {
    return EntityReader<T>::read(response);
}

}  // namespace wirecall
