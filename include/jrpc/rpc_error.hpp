/**
 * @file rpc_error.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include <jrpc/config.h>

namespace jrpc {

/**
 * @brief Error codes reserved by JSON-RPC 2.0, plus the generic code used
 * for failures that originate locally.
 *
 */
enum struct ErrorCode : int32_t {
    kGeneric = -1,
    kParseError = -32700,
    kInvalidRequest = -32600,
    kMethodNotFound = -32601,
    kInvalidParams = -32602,
    kInternalError = -32603
};

/** Standard message text for a reserved code. */
std::string defaultMessage(ErrorCode code);

/**
 * @brief A JSON-RPC 2.0 error object, as found in the "error" member of a
 * response. This is a plain value: equality compares all fields, copies are
 * independent.
 *
 */
struct JRPCEXPORT RpcError {
    RpcError() = default;
    RpcError(int32_t c, std::string msg, std::optional<nlohmann::json> d = std::nullopt);
    RpcError(ErrorCode c, std::string msg, std::optional<nlohmann::json> d = std::nullopt);

    /**
     * @brief Build an error for one of the reserved codes. An empty message
     * is replaced by the standard text for that code.
     *
     * @param code Reserved code
     * @param message Optional message override
     * @return RpcError
     */
    static RpcError fromCode(ErrorCode code, const std::string &message = "");

    /**
     * @brief Compact JSON form, also used as the debug representation. This is
     * the wire object rather than a field-by-field dump. Invalid UTF-8 in the
     * message or data is replaced by U+FFFD, so this never throws.
     */
    std::string toString() const;

    int32_t code = static_cast<int32_t>(ErrorCode::kGeneric);
    std::string message;
    std::optional<nlohmann::json> data;
};

bool operator==(const RpcError &a, const RpcError &b);
bool operator!=(const RpcError &a, const RpcError &b);

std::ostream &operator<<(std::ostream &os, const RpcError &err);

/**
 * @brief Write the wire object. An absent data member is written as null.
 */
void to_json(nlohmann::json &j, const RpcError &err);

/**
 * @brief Read a wire error object. A null data member is read as absent.
 *
 * @throw nlohmann::json::type_error if not an object, or if code or message
 * have the wrong type.
 * @throw nlohmann::json::out_of_range if code or message are missing, or if
 * code does not fit in 32 bits.
 */
void from_json(const nlohmann::json &j, RpcError &err);

}  // namespace jrpc
