#pragma once

#include "langbridge/cli.hpp"
#include "langbridge/config.hpp"
#include "langbridge/format.hpp"
#include "langbridge/json.hpp"
#include "langbridge/lsp/client.hpp"
#include "langbridge/lsp/dispatch.hpp"
#include "langbridge/lsp/framing.hpp"
#include "langbridge/lsp/pending.hpp"
#include "langbridge/lsp/protocol.hpp"
#include "langbridge/lsp/uri.hpp"
#include "langbridge/mcp.hpp"
#include "langbridge/pagination.hpp"
#include "langbridge/process.hpp"
#include "langbridge/tools.hpp"
#include "langbridge/utils.hpp"
#include "langbridge/workspace.hpp"
