#pragma once

/// Umbrella header for the rpcwire JSON-RPC client library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "json_rpc.hpp"
#include "api_key.hpp"
#include "service_address.hpp"
#include "codec.hpp"
#include "http_message.hpp"
#include "client.hpp"
#include "transport/tcp_stream.hpp"
#include "transport/http_transport.hpp"
