/**
 * @file response.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <jrpc/config.h>
#include <jrpc/error.hpp>
#include <jrpc/rpc_error.hpp>

namespace jrpc {

/** Protocol version string sent and expected in the "jsonrpc" member. */
static constexpr const char *kVersion = "2.0";

/**
 * @brief A JSON-RPC 2.0 response envelope. Used on the client side to check
 * an incoming reply against its request, and on the serving side to write
 * a reply, including one that reports an Error.
 *
 */
struct JRPCEXPORT Response {
    std::optional<std::string> jsonrpc;
    nlohmann::json id;
    std::optional<nlohmann::json> result;  // Present even when null
    std::optional<RpcError> error;

    /**
     * @brief Decode a response from raw bytes. The "result" member counts as
     * present even when it is null, an "error" member of null counts as
     * absent.
     *
     * @param payload Raw message received from the transport
     * @return Response
     * @throw RpcException holding a decode failure if the payload is not
     * JSON or does not have the shape of a response.
     */
    static Response parse(const std::string &payload);

    /** As parse(), but from an already decoded value. */
    static Response fromJson(const nlohmann::json &j);

    /** Successful reply to request `id`. */
    static Response success(const nlohmann::json &id, const nlohmann::json &result);

    /** Error reply to request `id`; any Error can be reported. */
    static Response failure(const nlohmann::json &id, const Error &err);

    /**
     * @brief Check this response against the id of the request it answers.
     * Checks are made in order: version, id, error, result.
     *
     * @param expected_id Id of the outstanding request
     * @return The first failure found, or nothing if a result is available
     */
    std::optional<Error> check(const nlohmann::json &expected_id) const;

    /**
     * @brief Get the result value after a successful check().
     *
     * @throw RpcException with the failure reported by check()
     */
    nlohmann::json value(const nlohmann::json &expected_id) const;

    nlohmann::json toJson() const;

    /** Compact wire form. */
    std::string dump() const;
};

}  // namespace jrpc
