#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <jrpc/error.hpp>

using jrpc::Error;
using jrpc::ErrorKind;
using jrpc::RpcError;
using jrpc::RpcException;
using nlohmann::json;

static json::parse_error makeParseError(const std::string &text) {
    try {
        auto j = json::parse(text);
    } catch (const json::parse_error &e) {
        return e;
    }
    throw std::logic_error("expected parse failure: " + text);
}

namespace {
struct DiskStatus {
    std::string text;
};

std::ostream &operator<<(std::ostream &os, const DiskStatus &s) {
    os << s.text;
    return os;
}
}  // namespace

// --- Tests -------------------------------------------------------------------

TEST_CASE("Error from decode failure", "[error]") {
    auto pe = makeParseError("{");
    Error err = pe;

    SECTION("is a decode failure") {
        REQUIRE( err.kind() == ErrorKind::kDecodeFailure );
        REQUIRE( err.isDecodeFailure() );
        REQUIRE( err.decodeFailure() != nullptr );
        REQUIRE( err.decodeFailure()->id == 101 );
        REQUIRE( err.rpcError() == nullptr );
    }

    SECTION("displays the decode error") {
        REQUIRE( err.toString() == std::string("JSON decode error: ") + pe.what() );
    }

    SECTION("exposes the decode error as cause") {
        auto cause = err.cause();
        REQUIRE( cause != nullptr );
        REQUIRE_THROWS_AS( std::rethrow_exception(cause), json::parse_error );
    }

    SECTION("type errors are decode failures too") {
        try {
            json j = "text";
            auto n = j.get<int>();
            (void)n;
            FAIL( "expected type error" );
        } catch (const json::type_error &e) {
            Error te = e;
            REQUIRE( te.isDecodeFailure() );
            REQUIRE_THROWS_AS( std::rethrow_exception(te.cause()), json::type_error );
        }
    }
}

TEST_CASE("Error from transport failure", "[error]") {
    SECTION("from error_code") {
        auto ec = std::make_error_code(std::errc::connection_reset);
        Error err = ec;
        REQUIRE( err.kind() == ErrorKind::kTransportFailure );
        REQUIRE( err.transportFailure()->code == ec );
        REQUIRE( err.toString() == "IO error response: " + ec.message() );
    }

    SECTION("from system_error") {
        std::system_error se(std::make_error_code(std::errc::broken_pipe), "write");
        Error err = se;
        REQUIRE( err.isTransportFailure() );
        REQUIRE( err.toString() == std::string("IO error response: ") + se.what() );
    }

    SECTION("has no cause") {
        Error err = std::make_error_code(std::errc::timed_out);
        REQUIRE( err.cause() == nullptr );
    }
}

TEST_CASE("Error from RpcError", "[error]") {
    RpcError rpc(7, "boom");
    Error err = rpc;

    SECTION("wraps an equal value") {
        REQUIRE( err.kind() == ErrorKind::kRpcFailure );
        REQUIRE( *err.rpcError() == rpc );
    }

    SECTION("round trips to an equal value") {
        RpcError back = err.toRpcError();
        REQUIRE( back == rpc );
        REQUIRE( back.code == 7 );
        REQUIRE( back.message == "boom" );
        REQUIRE_FALSE( back.data.has_value() );
    }

    SECTION("conversion leaves the error usable") {
        RpcError back = err.toRpcError();
        back.message = "changed";
        REQUIRE( err.rpcError()->message == "boom" );
        REQUIRE( err.toRpcError() == rpc );
    }

    SECTION("keeps structured data") {
        Error with_data = RpcError(-32602, "Invalid params", json{{"param", "x"}});
        REQUIRE( *with_data.toRpcError().data == json{{"param", "x"}} );
    }

    SECTION("displays debug form") {
        REQUIRE( err.toString() == R"(RPC error response: {"code":7,"data":null,"message":"boom"})" );
    }

    SECTION("has no cause") {
        REQUIRE( err.cause() == nullptr );
    }
}

TEST_CASE("Error protocol variants", "[error]") {
    SECTION("missing outcome") {
        Error err = jrpc::MissingOutcome{};
        REQUIRE( err.kind() == ErrorKind::kMissingOutcome );
        REQUIRE( err.toString() == "Malformed RPC response" );
    }

    SECTION("nonce mismatch") {
        Error err = jrpc::NonceMismatch{};
        REQUIRE( err.kind() == ErrorKind::kNonceMismatch );
        REQUIRE( err.toString() == "Nonce of response did not match nonce of request" );
    }

    SECTION("version mismatch") {
        Error err = jrpc::VersionMismatch{};
        REQUIRE( err.kind() == ErrorKind::kVersionMismatch );
        REQUIRE( err.toString() == "`jsonrpc` field set to non-\"2.0\"" );
    }

    SECTION("none have a cause") {
        REQUIRE( Error(jrpc::MissingOutcome{}).cause() == nullptr );
        REQUIRE( Error(jrpc::NonceMismatch{}).cause() == nullptr );
        REQUIRE( Error(jrpc::VersionMismatch{}).cause() == nullptr );
    }

    SECTION("stream output matches toString") {
        std::stringstream ss;
        ss << Error(jrpc::NonceMismatch{});
        REQUIRE( ss.str() == "Nonce of response did not match nonce of request" );
    }
}

TEST_CASE("Error to RpcError for local failures", "[error]") {
    std::vector<Error> errors = {
        Error(makeParseError("{")),
        Error(std::make_error_code(std::errc::connection_refused)),
        Error(jrpc::MissingOutcome{}),
        Error(jrpc::NonceMismatch{}),
        Error(jrpc::VersionMismatch{})
    };

    for (const auto &err : errors) {
        RpcError rpc = err.toRpcError();
        REQUIRE( rpc.code == -1 );
        REQUIRE( rpc.message == err.toString() );
        REQUIRE_FALSE( rpc.data.has_value() );
    }
}

TEST_CASE("Error from opaque failure", "[error]") {
    SECTION("from exception") {
        Error err = Error::fromFailure(std::runtime_error("disk full"));
        REQUIRE( err.isRpcFailure() );
        REQUIRE( *err.rpcError() == RpcError(-1, "disk full") );
    }

    SECTION("from printable value") {
        Error err = Error::fromFailure(DiskStatus{"disk full"});
        REQUIRE( *err.rpcError() == RpcError(-1, "disk full") );
    }

    SECTION("from string") {
        Error err = Error::fromFailure(std::string("disk full"));
        REQUIRE( err.toRpcError() == RpcError(-1, "disk full") );
    }

    SECTION("has no cause") {
        REQUIRE( Error::fromFailure(std::runtime_error("x")).cause() == nullptr );
    }

    SECTION("invalid utf-8 is still displayed") {
        Error err = Error::fromFailure(std::runtime_error("bad \xc3"));
        std::stringstream ss;
        REQUIRE_NOTHROW( ss << err );
        REQUIRE( ss.str() == "RPC error response: {\"code\":-1,\"data\":null,\"message\":\"bad \xEF\xBF\xBD\"}" );
        REQUIRE( err.rpcError()->message == "bad \xc3" );
    }
}

TEST_CASE("Error from captured exception", "[error]") {
    auto capture = [](auto &&fn) {
        try {
            fn();
        } catch (...) {
            return Error::fromException(std::current_exception());
        }
        throw std::logic_error("nothing thrown");
    };

    SECTION("json exception is a decode failure") {
        auto err = capture([]() { auto j = json::parse("{"); });
        REQUIRE( err.isDecodeFailure() );
    }

    SECTION("system error is a transport failure") {
        auto err = capture([]() { throw std::system_error(std::make_error_code(std::errc::io_error)); });
        REQUIRE( err.isTransportFailure() );
    }

    SECTION("rpc exception keeps its error") {
        auto err = capture([]() { throw RpcException(Error(jrpc::NonceMismatch{})); });
        REQUIRE( err.kind() == ErrorKind::kNonceMismatch );
    }

    SECTION("other exception is absorbed") {
        auto err = capture([]() { throw std::runtime_error("disk full"); });
        REQUIRE( *err.rpcError() == RpcError(-1, "disk full") );
    }

    SECTION("unknown exception is absorbed") {
        auto err = capture([]() { throw 5; });
        REQUIRE( *err.rpcError() == RpcError(-1, "Unknown exception") );
    }

    SECTION("null pointer") {
        auto err = Error::fromException(nullptr);
        REQUIRE( err.isRpcFailure() );
        REQUIRE( err.rpcError()->code == -1 );
    }
}

TEST_CASE("RpcException", "[error]") {
    SECTION("carries the error") {
        try {
            throw RpcException(Error(RpcError(7, "boom")));
        } catch (const RpcException &e) {
            REQUIRE( e.error().toRpcError() == RpcError(7, "boom") );
            REQUIRE( std::string(e.what()) == e.error().toString() );
        }
    }

    SECTION("carries an undecodable payload") {
        try {
            Error err = makeParseError("\xff");
            throw RpcException(err.toRpcError());
        } catch (const RpcException &e) {
            REQUIRE( e.error().isRpcFailure() );
            REQUIRE( e.error().toRpcError().toString().find("\"code\":-1") != std::string::npos );
        }
    }

    SECTION("shared between threads") {
        std::exception_ptr ptr;
        try {
            throw RpcException(Error(jrpc::NonceMismatch{}));
        } catch (...) {
            ptr = std::current_exception();
        }

        std::vector<Error> results(4, Error(jrpc::MissingOutcome{}));
        std::vector<std::thread> threads;
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&results, ptr, i]() {
                for (int n = 0; n < 100; ++n) {
                    results[i] = Error::fromException(ptr);
                }
            });
        }
        for (auto &t : threads) t.join();

        for (const auto &err : results) {
            REQUIRE( err.kind() == ErrorKind::kNonceMismatch );
        }
    }
}
