// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/event_loop.hpp"
#include "core/executor.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "crypto/digest.hpp"
#include "net/connection_manager.hpp"
#include "net/keep_alive_monitor.hpp"
#include "net/reconnect_scheduler.hpp"
#include "net/transport.hpp"
#include "parsers/minimal_toml.hpp"
#include "service/relay_config.hpp"
#include "service/relay_service.hpp"
#include "sim/journal_sync_target.hpp"
#include "sim/replay_transport.hpp"
#include "sync/events.hpp"
#include "sync/field_sync.hpp"
#include "sync/orchestrator.hpp"
#include "sync/quantity.hpp"
#include "sync/sync_target.hpp"

#define VAULTRELAY_DEFAULT_CONFIG_FILE_PATH "/etc/vaultrelay/vaultrelay.toml"
