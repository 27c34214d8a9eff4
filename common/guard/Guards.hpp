#pragma once

/**
 * @brief 守卫模块统一入口
 */

#include "GuardRule.hpp"
#include "RuleParser.hpp"
#include "Guard.hpp"
#include "GuardRegistry.hpp"
#include "BuiltinGuards.hpp"
#include "FailureReport.hpp"
#include "GuardEvaluator.hpp"
