#pragma once

/**
 * @brief 领域基础设施统一入口
 *
 * 使用示例：
 * @code
 * #include "common/domain/Domain.hpp"
 *
 * struct PersonCreated : DomainEvent {
 *     std::string name;
 *     PersonCreated(Guid id, std::string n)
 *         : DomainEvent("PersonCreated", std::move(id), "Person"), name(std::move(n)) {}
 * };
 * @endcode
 */

#include "Guid.hpp"              // 聚合根标识
#include "DomainEvent.hpp"       // 领域事件定义
#include "Aggregate.hpp"         // 聚合根基类
#include "EventBus.hpp"          // 事件绑定与分发
#include "WatchedList.hpp"       // 子集合变更跟踪
