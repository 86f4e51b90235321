/**
 * @file jrpc.hpp
 * @copyright Copyright (c) 2022 University of Turku, MIT License
 * @author Nicolas Pope
 */

#pragma once

/**
 * @brief JSON-RPC 2.0 client errors: the failure taxonomy, the wire error
 * object and the response envelope that connects the two.
 * 
 */
namespace jrpc {
}  // namespace jrpc

#include <jrpc/config.h>
#include <jrpc/exception.hpp>
#include <jrpc/rpc_error.hpp>
#include <jrpc/error.hpp>
#include <jrpc/response.hpp>
