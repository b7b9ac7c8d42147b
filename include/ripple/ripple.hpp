#pragma once
#include <ripple/version.hpp>

#include <ripple/core/log.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/core/callback_registry.hpp>
#include <ripple/core/subject.hpp>

#include <ripple/ops/map.hpp>
#include <ripple/ops/filter.hpp>
#include <ripple/ops/take.hpp>
#include <ripple/ops/from_values.hpp>
