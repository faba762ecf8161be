#pragma once

#include "imagen/backend.hpp"
#include "imagen/cli.hpp"
#include "imagen/config.hpp"
#include "imagen/error.hpp"
#include "imagen/format.hpp"
#include "imagen/http.hpp"
#include "imagen/mcp.hpp"
#include "imagen/store.hpp"
#include "imagen/supervisor.hpp"
#include "imagen/tool.hpp"
#include "imagen/utils.hpp"
