#pragma once

#include "Guid.hpp"

/**
 * @brief 领域事件基类
 *
 * 领域事件代表聚合根上发生的业务事实，由聚合根登记、由 EventBus 分发。
 * 具体事件从本类派生并携带自己的数据字段；事件类型以派生类的动态类型区分，
 * type 字段只用于日志。
 */
struct DomainEvent {
    std::string type;                    // 事件类型标识
    Guid aggregateId;                    // 聚合根标识
    std::string aggregateType;           // 聚合根类型
    std::chrono::system_clock::time_point occurredAt;  // 发生时间

    DomainEvent(std::string eventType, Guid aggId, std::string aggType = "")
        : type(std::move(eventType))
        , aggregateId(std::move(aggId))
        , aggregateType(std::move(aggType))
        , occurredAt(std::chrono::system_clock::now()) {}

    virtual ~DomainEvent() = default;

    DomainEvent(const DomainEvent&) = default;
    DomainEvent& operator=(const DomainEvent&) = default;
    DomainEvent(DomainEvent&&) = default;
    DomainEvent& operator=(DomainEvent&&) = default;
};
