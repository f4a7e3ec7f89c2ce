#pragma once

// Convenience header pulling in the whole library

#include "batch_context.hpp"
#include "completion.hpp"
#include "completion_exceptions.hpp"
#include "configuration.hpp"
#include "console_logger.hpp"
#include "exceptions.hpp"
#include "filter_list.hpp"
#include "future.hpp"
#include "logger.hpp"
#include "memory_push_channel.hpp"
#include "metrics.hpp"
#include "port_allocation_binder.hpp"
#include "port_allocator.hpp"
#include "push_channel.hpp"
#include "qualified_name.hpp"
#include "reconciler.hpp"
#include "reconciliation_plan.hpp"
#include "resource_codec.hpp"
#include "resource_normalizer.hpp"
#include "resource_set.hpp"
#include "resource_validator.hpp"
#include "types.hpp"
