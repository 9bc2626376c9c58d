// Copyright (c) 2025 Omnilink Authors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Omnilink, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "auth/authenticator.hpp"
#include "client/client.hpp"
#include "client/client_config.hpp"
#include "client/client_factory.hpp"
#include "client/client_stats.hpp"
#include "client/connection.hpp"
#include "core/config_loader.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "core/timer.hpp"
#include "network/endpoint_selector.hpp"
#include "network/json_rpc_http_client.hpp"
#include "network/websocket_transport.hpp"
#include "rpc/envelope.hpp"
#include "rpc/errors.hpp"
#include "rpc/pending_call_registry.hpp"
