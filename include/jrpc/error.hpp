/**
 * @file error.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once

#include <exception>
#include <ostream>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>
#include <nlohmann/json.hpp>
#include <jrpc/config.h>
#include <jrpc/exception.hpp>
#include <jrpc/rpc_error.hpp>

namespace jrpc {

/**
 * @brief Which kind of failure an Error holds. Matches the order of the
 * alternatives in Error::variant_t.
 *
 */
enum struct ErrorKind {
    kDecodeFailure,     // payload was not valid JSON, or had the wrong shape
    kTransportFailure,  // stream could not be read or written
    kRpcFailure,        // peer returned an error object
    kMissingOutcome,    // neither result nor error
    kNonceMismatch,     // response id != request id
    kVersionMismatch    // jsonrpc != "2.0"
};

/** Decode error detail, taken from a nlohmann::json exception. */
struct DecodeFailure {
    int id = 0;
    std::string message;
    std::exception_ptr cause;
};

/** I/O error detail. */
struct TransportFailure {
    std::error_code code;
    std::string message;
};

struct MissingOutcome {};
struct NonceMismatch {};
struct VersionMismatch {};

/**
 * @brief Any failure of an RPC round trip, local or reported by the peer.
 * Exactly one alternative is held at a time. Construction from each failure
 * source is implicit so that errors from the JSON, I/O and wire layers can
 * be returned directly as an Error.
 *
 */
class JRPCEXPORT Error {
 public:
    using variant_t = std::variant<
        DecodeFailure,
        TransportFailure,
        RpcError,
        MissingOutcome,
        NonceMismatch,
        VersionMismatch>;

    Error(const nlohmann::json::exception &e);
    Error(const std::system_error &e);
    Error(std::error_code ec);
    Error(const RpcError &e);
    Error(RpcError &&e);
    Error(MissingOutcome);
    Error(NonceMismatch);
    Error(VersionMismatch);

    /**
     * @brief Absorb a failure that has nothing but a display form. The
     * result is always an RPC failure with the generic code and the display
     * text as message. Exceptions are displayed with what(), anything else
     * must be printable with operator<<.
     *
     * @tparam T Failure type
     * @param failure The failure value
     * @return Error
     */
    template <typename T>
    static Error fromFailure(const T &failure);

    /**
     * @brief Classify a captured exception. JSON exceptions become decode
     * failures, system errors become transport failures, an RpcException
     * yields its own error and everything else is absorbed as an opaque
     * failure.
     *
     * @param ptr A non-null exception pointer, eg. std::current_exception()
     * @return Error
     */
    static Error fromException(std::exception_ptr ptr);

    ErrorKind kind() const { return static_cast<ErrorKind>(value_.index()); }

    bool isDecodeFailure() const { return kind() == ErrorKind::kDecodeFailure; }
    bool isTransportFailure() const { return kind() == ErrorKind::kTransportFailure; }
    bool isRpcFailure() const { return kind() == ErrorKind::kRpcFailure; }

    /** Payload accessors, nullptr if a different kind is held. */
    const DecodeFailure *decodeFailure() const { return std::get_if<DecodeFailure>(&value_); }
    const TransportFailure *transportFailure() const { return std::get_if<TransportFailure>(&value_); }
    const RpcError *rpcError() const { return std::get_if<RpcError>(&value_); }

    const variant_t &variant() const { return value_; }

    /**
     * @brief The underlying cause, if exposed. Only decode failures expose
     * one; it rethrows as the original nlohmann::json exception type.
     *
     * @return std::exception_ptr or nullptr
     */
    std::exception_ptr cause() const;

    /** Single line human readable description. */
    std::string toString() const;

    /**
     * @brief Get a wire error object for this error. An RPC failure returns a
     * copy of its payload, any other kind gives the generic code with the
     * display text as message and no data.
     *
     * @return RpcError
     */
    RpcError toRpcError() const;

 private:
    variant_t value_;
};

std::ostream &operator<<(std::ostream &os, const Error &err);

/** Exception form of an Error, for call paths that throw. */
class JRPCEXPORT RpcException : public jrpc::exception {
 public:
    explicit RpcException(const Error &err);

    /** Reading the error counts as reporting the exception. */
    const Error &error() const {
        ignore();
        return error_;
    }

 private:
    Error error_;
};

// --- Template Implementations ------------------------------------------------

template <typename T>
Error Error::fromFailure(const T &failure) {
    if constexpr (std::is_base_of_v<std::exception, T>) {
        return Error(RpcError(ErrorCode::kGeneric, failure.what()));
    } else {
        return Error(RpcError(ErrorCode::kGeneric, jrpc::Formatter() << failure));
    }
}

}  // namespace jrpc
