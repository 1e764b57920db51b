#pragma once
/**
 * @file amod_service.hpp
 * @brief Layer 2: Service modules built on amod_base.
 *
 * Provides the asynchronous Logger (and its LoggerGuard), the Result<T, E> outcome
 * type, and the doubling backoff schedule used by admission waits.
 */
#include "amod_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
