#pragma once

// nodefs - Aggregate Header
// Include this for the full node abstraction and every backend

#include "nodefs/error.hpp"
#include "nodefs/path.hpp"
#include "nodefs/sequence.hpp"
#include "nodefs/stream.hpp"
#include "nodefs/digest.hpp"
#include "nodefs/node.hpp"
#include "nodefs/capabilities.hpp"
#include "nodefs/filesystem.hpp"
#include "nodefs/reconnect.hpp"
#include "nodefs/address.hpp"
#include "nodefs/registry.hpp"

// Backend implementations
#include "nodefs/backends/local.hpp"
#include "nodefs/backends/memory.hpp"
#include "nodefs/backends/ftp.hpp"
#include "nodefs/backends/url.hpp"
