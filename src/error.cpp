/**
 * @file error.cpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#include <string>
#include <utility>
#include <loguru.hpp>
#include <jrpc/error.hpp>

using jrpc::Error;
using jrpc::RpcError;
using jrpc::RpcException;
using jrpc::ErrorCode;
using nlohmann::json;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Keep the concrete exception type so that cause() rethrows as what was caught.
static std::exception_ptr captureJsonException(const json::exception &e) {
    if (auto *p = dynamic_cast<const json::parse_error*>(&e)) return std::make_exception_ptr(*p);
    if (auto *p = dynamic_cast<const json::type_error*>(&e)) return std::make_exception_ptr(*p);
    if (auto *p = dynamic_cast<const json::out_of_range*>(&e)) return std::make_exception_ptr(*p);
    if (auto *p = dynamic_cast<const json::invalid_iterator*>(&e)) return std::make_exception_ptr(*p);
    if (auto *p = dynamic_cast<const json::other_error*>(&e)) return std::make_exception_ptr(*p);
    return std::make_exception_ptr(e);
}

Error::Error(const json::exception &e)
    : value_(DecodeFailure{e.id, e.what(), captureJsonException(e)}) {}

Error::Error(const std::system_error &e)
    : value_(TransportFailure{e.code(), e.what()}) {}

Error::Error(std::error_code ec)
    : value_(TransportFailure{ec, ec.message()}) {}

Error::Error(const RpcError &e) : value_(e) {}

Error::Error(RpcError &&e) : value_(std::move(e)) {}

Error::Error(MissingOutcome v) : value_(v) {}

Error::Error(NonceMismatch v) : value_(v) {}

Error::Error(VersionMismatch v) : value_(v) {}

Error Error::fromException(std::exception_ptr ptr) {
    if (!ptr) {
        return fromFailure("No exception");
    }

    try {
        std::rethrow_exception(ptr);
    } catch (const RpcException &e) {
        e.ignore();
        return e.error();
    } catch (const json::exception &e) {
        return Error(e);
    } catch (const std::system_error &e) {
        return Error(e);
    } catch (const std::exception &e) {
        return fromFailure(e);
    } catch (...) {
        LOG(WARNING) << "Absorbing exception of unknown type into RPC error";
        return fromFailure("Unknown exception");
    }
}

std::exception_ptr Error::cause() const {
    if (auto *d = std::get_if<DecodeFailure>(&value_)) {
        return d->cause;
    }
    return nullptr;
}

std::string Error::toString() const {
    return std::visit(overloaded {
        [](const DecodeFailure &e) { return "JSON decode error: " + e.message; },
        [](const TransportFailure &e) { return "IO error response: " + e.message; },
        [](const RpcError &e) { return "RPC error response: " + e.toString(); },
        [](const MissingOutcome &) { return std::string("Malformed RPC response"); },
        [](const NonceMismatch &) { return std::string("Nonce of response did not match nonce of request"); },
        [](const VersionMismatch &) { return std::string("`jsonrpc` field set to non-\"2.0\""); }
    }, value_);
}

RpcError Error::toRpcError() const {
    if (auto *rpc = std::get_if<RpcError>(&value_)) {
        return *rpc;
    }
    return RpcError(ErrorCode::kGeneric, toString());
}

std::ostream &jrpc::operator<<(std::ostream &os, const Error &err) {
    os << err.toString();
    return os;
}

RpcException::RpcException(const Error &err)
    : jrpc::exception(jrpc::Formatter() << err.toString()), error_(err) {}
