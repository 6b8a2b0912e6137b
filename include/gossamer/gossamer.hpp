// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Gossamer, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file gossamer.hpp
/// \brief Convenience header pulling in the whole library.

#pragma once

#include "gossamer/core/blocking_queue.hpp"
#include "gossamer/core/cancellation.hpp"
#include "gossamer/core/config_loader.hpp"
#include "gossamer/core/json.hpp"
#include "gossamer/core/logger.hpp"
#include "gossamer/core/worker_group.hpp"

#include "gossamer/network/accept_dispatcher.hpp"
#include "gossamer/network/byte_order.hpp"
#include "gossamer/network/conn_pool.hpp"
#include "gossamer/network/fallback_send.hpp"
#include "gossamer/network/gossip_transport.hpp"
#include "gossamer/network/ip_utils.hpp"
#include "gossamer/network/membership_transport.hpp"
#include "gossamer/network/mux_frame.hpp"
#include "gossamer/network/mux_session.hpp"
#include "gossamer/network/session.hpp"
#include "gossamer/network/stream_conn.hpp"
#include "gossamer/network/tls_config.hpp"
#include "gossamer/network/tls_socket_transport.hpp"
#include "gossamer/network/tls_util.hpp"
#include "gossamer/network/transport_config.hpp"
#include "gossamer/network/transport_types.hpp"
