/**
 * @file response.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#include <string>
#include <loguru.hpp>
#include <jrpc/response.hpp>

using jrpc::Response;
using jrpc::Error;
using jrpc::RpcError;
using jrpc::RpcException;
using nlohmann::json;
using std::string;

Response Response::parse(const string &payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception &e) {
        DLOG(1) << "Could not parse RPC response: " << e.what();
        throw RpcException(Error(e));
    }
    return fromJson(j);
}

Response Response::fromJson(const json &j) {
    try {
        if (!j.is_object()) {
            throw json::type_error::create(302, "RPC response must be an object, but is " + string(j.type_name()), &j);
        }

        Response r;

        auto v = j.find("jsonrpc");
        if (v != j.end() && !v->is_null()) {
            r.jsonrpc.emplace(v->get<string>());
        }

        // Missing id is the same as null, eg. reply to an unparsable request
        auto id = j.find("id");
        if (id != j.end()) {
            r.id = *id;
        }

        auto res = j.find("result");
        if (res != j.end()) {
            r.result.emplace(*res);
        }

        auto err = j.find("error");
        if (err != j.end() && !err->is_null()) {
            r.error.emplace(err->get<RpcError>());
        }

        return r;
    } catch (const json::exception &e) {
        DLOG(1) << "Bad RPC response format: " << e.what();
        throw RpcException(Error(e));
    }
}

Response Response::success(const json &id, const json &result) {
    Response r;
    r.jsonrpc.emplace(kVersion);
    r.id = id;
    r.result.emplace(result);
    return r;
}

Response Response::failure(const json &id, const Error &err) {
    Response r;
    r.jsonrpc.emplace(kVersion);
    r.id = id;
    r.error.emplace(err.toRpcError());
    return r;
}

std::optional<Error> Response::check(const json &expected_id) const {
    if (jsonrpc && *jsonrpc != kVersion) {
        DLOG(1) << "RPC response has version " << *jsonrpc;
        return Error(VersionMismatch{});
    }
    if (id != expected_id) {
        DLOG(1) << "RPC response id " << id.dump() << " does not match request " << expected_id.dump();
        return Error(NonceMismatch{});
    }
    if (error) {
        return Error(*error);
    }
    if (!result) {
        DLOG(1) << "RPC response " << id.dump() << " has no outcome";
        return Error(MissingOutcome{});
    }
    return std::nullopt;
}

json Response::value(const json &expected_id) const {
    if (auto err = check(expected_id)) {
        throw RpcException(*err);
    }
    return *result;
}

json Response::toJson() const {
    json j = json::object();
    if (jsonrpc) j["jsonrpc"] = *jsonrpc;
    if (result) j["result"] = *result;
    if (error) j["error"] = *error;
    j["id"] = id;
    return j;
}

string Response::dump() const {
    return toJson().dump(-1, ' ', false, json::error_handler_t::replace);
}
