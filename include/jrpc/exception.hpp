/**
 * @file exception.hpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once

#include <atomic>
#include <exception>
#include <sstream>
#include <string>
#include <jrpc/config.h>

namespace jrpc {

/**
 * @brief Helper class to enable stream style composition of exception
 * messages, as used by the JRPC_Error macro.
 *
 */
class Formatter {
 public:
    Formatter() {}
    ~Formatter() {}

    template <typename Type>
    inline Formatter & operator << (const Type & value) {
        stream_ << value;
        return *this;
    }

    inline std::string str() const         { return stream_.str(); }
    inline operator std::string () const   { return stream_.str(); }

    enum ConvertToString {
        to_str
    };
    inline std::string operator >> (ConvertToString) { return stream_.str(); }

 private:
    std::stringstream stream_;

    Formatter(const Formatter &);
    Formatter & operator = (Formatter &);
};

/**
 * @brief Library exception. Holds the message and, where supported, a stack
 * trace of the throw site. An exception that is destroyed without its
 * message ever having been read is logged as an error, so that failures
 * swallowed by a caller still leave a trace.
 *
 */
class JRPCEXPORT exception : public std::exception {
 public:
    explicit exception(const char *msg);
    explicit exception(const Formatter &msg);
    exception(const exception &other);
    ~exception() override;

    inline const char * what() const noexcept override {
        processed_ = true;
        return msg_.c_str();
    }

    inline const char *trace() const {
        return trace_.c_str();
    }

    /** Mark as reported without reading the message. */
    inline void ignore() const { processed_ = true; }

 private:
    std::string decode_backtrace() const;

    std::string msg_;
    std::string trace_;
    mutable std::atomic<bool> processed_;
};

}  // namespace jrpc

#define JRPC_Error(A) (jrpc::exception(jrpc::Formatter() << A << " [" << __FILE__ << ":" << __LINE__ << "]"))
