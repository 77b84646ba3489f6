#pragma once

#include "klpforge/assembly.hpp"
#include "klpforge/build.hpp"
#include "klpforge/cli.hpp"
#include "klpforge/config.hpp"
#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/graph.hpp"
#include "klpforge/inspect.hpp"
#include "klpforge/kconfig.hpp"
#include "klpforge/layout.hpp"
#include "klpforge/pipeline.hpp"
#include "klpforge/process.hpp"
#include "klpforge/symbols.hpp"
#include "klpforge/transaction.hpp"
#include "klpforge/utils.hpp"
#include "klpforge/workspace.hpp"
#include "klpforge/wrapper.hpp"
