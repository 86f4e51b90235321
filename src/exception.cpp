/**
 * @file exception.cpp
 * @copyright Copyright (c) 2020 University of Turku, MIT License
 * @author Nicolas Pope
 */

#include <string>
#include <loguru.hpp>
#include <jrpc/exception.hpp>

#ifndef WIN32
#include <execinfo.h>
#include <cxxabi.h>
#include <cstdlib>
#endif

using jrpc::exception;
using std::string;

#ifndef WIN32
static std::string demangle(const char* name) {
    if (!name) {
        return "[unknown symbol]";
    }
    int status;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (!demangled) {
        return std::string(name);
    }
    std::string result(demangled);
    free(demangled);
    return result;
}
#endif

exception::exception(const char *msg) : msg_(msg), processed_(false) {
    trace_ = decode_backtrace();
}

exception::exception(const jrpc::Formatter &msg) : msg_(msg.str()), processed_(false) {
    trace_ = decode_backtrace();
}

exception::exception(const exception &other)
    : std::exception(other), msg_(other.msg_), trace_(other.trace_), processed_(other.processed_.load()) {
    // Only the last copy alive is responsible for reporting.
    other.processed_ = true;
}

std::string exception::decode_backtrace() const {
#ifndef WIN32
    void *trace[16];
    int trace_size = backtrace(trace, 16);
    char **messages = backtrace_symbols(trace, trace_size);
    if (!messages) return "";

    string result;
    // Skip the exception constructor frames
    for (int i = 2; i < trace_size; ++i) {
        string line(messages[i]);

        // Extract the mangled name between '(' and '+'
        auto begin = line.find('(');
        auto end = line.find('+', begin);
        if (begin != string::npos && end != string::npos) {
            string mangled = line.substr(begin + 1, end - begin - 1);
            if (!mangled.empty()) {
                line = line.substr(0, begin + 1) + demangle(mangled.c_str()) + line.substr(end);
            }
        }
        result += string("[bt] ") + line + "\n";
    }
    free(messages);
    return result;
#else
    return "";
#endif
}

exception::~exception() {
    if (!processed_) {
        LOG(ERROR) << "Unreported exception: " << msg_;
        if (!trace_.empty()) LOG(ERROR) << trace_;
    }
}
