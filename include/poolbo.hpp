// File: poolbo.hpp

#ifndef POOLBO_HPP
#define POOLBO_HPP

#include "benchmark/objective_functions.hpp"
#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "config/run_settings.hpp"
#include "optimization/acquisition.hpp"
#include "optimization/gaussian/gp.hpp"
#include "optimization/pool_optimizer.hpp"
#include "sampling/sampler/lhs.hpp"
#include "scaling/scaler_factory.hpp"
#include "types/candidate_pool.hpp"

#endif // POOLBO_HPP
