#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "mavftp/core/constants.hpp"
#include "mavftp/core/error.hpp"
#include "mavftp/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "mavftp/util/crc32.hpp"
#include "mavftp/util/event.hpp"
#include "mavftp/util/state_machine.hpp"

// ─── Protocol ────────────────────────────────────────────────────────────────
#include "mavftp/protocol/opcode.hpp"
#include "mavftp/protocol/packet.hpp"

// ─── Session ─────────────────────────────────────────────────────────────────
#include "mavftp/session/retry.hpp"
#include "mavftp/session/tracker.hpp"

// ─── Transfers ───────────────────────────────────────────────────────────────
#include "mavftp/transfer/command.hpp"
#include "mavftp/transfer/directory.hpp"
#include "mavftp/transfer/list.hpp"
#include "mavftp/transfer/machine.hpp"
#include "mavftp/transfer/read.hpp"
#include "mavftp/transfer/write.hpp"

// ─── Transport ───────────────────────────────────────────────────────────────
#include "mavftp/transport/link_transport.hpp"
#include "mavftp/transport/transport.hpp"

// ─── Client ──────────────────────────────────────────────────────────────────
#include "mavftp/client/client.hpp"
#include "mavftp/client/config.hpp"
#include "mavftp/client/engine.hpp"
