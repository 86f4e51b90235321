/**
 * @file rpc_error.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#include <limits>
#include <string>
#include <utility>
#include <jrpc/rpc_error.hpp>

using jrpc::RpcError;
using jrpc::ErrorCode;
using nlohmann::json;

std::string jrpc::defaultMessage(ErrorCode code) {
    switch (code) {
    case ErrorCode::kParseError      : return "Parse error";
    case ErrorCode::kInvalidRequest  : return "Invalid Request";
    case ErrorCode::kMethodNotFound  : return "Method not found";
    case ErrorCode::kInvalidParams   : return "Invalid params";
    case ErrorCode::kInternalError   : return "Internal error";
    case ErrorCode::kGeneric         : return "Error";
    }
    return "Unknown error";
}

RpcError::RpcError(int32_t c, std::string msg, std::optional<json> d)
    : code(c), message(std::move(msg)), data(std::move(d)) {}

RpcError::RpcError(ErrorCode c, std::string msg, std::optional<json> d)
    : code(static_cast<int32_t>(c)), message(std::move(msg)), data(std::move(d)) {}

RpcError RpcError::fromCode(ErrorCode code, const std::string &message) {
    return RpcError(code, (message.empty()) ? defaultMessage(code) : message);
}

std::string RpcError::toString() const {
    json j = *this;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool jrpc::operator==(const RpcError &a, const RpcError &b) {
    if (a.code != b.code || a.message != b.message) return false;
    if (a.data.has_value() != b.data.has_value()) return false;
    return !a.data.has_value() || *a.data == *b.data;
}

bool jrpc::operator!=(const RpcError &a, const RpcError &b) {
    return !(a == b);
}

std::ostream &jrpc::operator<<(std::ostream &os, const RpcError &err) {
    os << err.toString();
    return os;
}

void jrpc::to_json(json &j, const RpcError &err) {
    j = json{
        {"code", err.code},
        {"message", err.message},
        {"data", (err.data) ? *err.data : json(nullptr)}
    };
}

void jrpc::from_json(const json &j, RpcError &err) {
    if (!j.is_object()) {
        throw json::type_error::create(302, "RPC error must be an object, but is " + std::string(j.type_name()), &j);
    }

    const json &code = j.at("code");
    if (!code.is_number_integer()) {
        throw json::type_error::create(302, "RPC error code must be an integer, but is " + std::string(code.type_name()), &code);
    }
    if (code.is_number_unsigned()) {
        if (code.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw json::out_of_range::create(406, "RPC error code out of range: " + code.dump(), &code);
        }
    } else {
        auto v = code.get<int64_t>();
        if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
            throw json::out_of_range::create(406, "RPC error code out of range: " + code.dump(), &code);
        }
    }

    err.code = code.get<int32_t>();
    err.message = j.at("message").get<std::string>();

    auto d = j.find("data");
    if (d != j.end() && !d->is_null()) {
        err.data = *d;
    } else {
        err.data.reset();
    }
}
