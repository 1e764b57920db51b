#pragma once
/**
 * @file amod_core.hpp
 * @brief Layer 3: The module manager and its collaborators.
 *
 * Includes the Async coroutine type, the cooperative Scheduler, Task and TaskDispatcher, the Module base class
 * and ModuleRegistry, the EventLoop queue, the SignalAdapter, ManagerConfig and the
 * ModuleManager facade.
 */
#include "amod_service.hpp"

#include <nlohmann/json.hpp>

#include "core/metadata.hpp"
#include "core/async.hpp"
#include "core/task.hpp"
#include "core/scheduler.hpp"
#include "core/failure_sink.hpp"
#include "core/task_dispatcher.hpp"
#include "core/module.hpp"
#include "core/module_registry.hpp"
#include "core/event_loop.hpp"
#include "core/signal_adapter.hpp"
#include "core/manager_config.hpp"
#include "core/module_manager.hpp"
