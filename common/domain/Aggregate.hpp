#pragma once

#include "DomainEvent.hpp"
#include "common/monads/Maybe.hpp"

/**
 * @brief 聚合根基类
 *
 * 负责标识和待分发事件队列：
 * - 标识在分配之前为 none
 * - remind() 登记事件（转移所有权），按登记顺序排队
 * - 事件由 EventBus::trigger() 取走并分发
 *
 * 使用示例：
 * @code
 * class Person : public AggregateRoot<Person> {
 * public:
 *     static Person create(Guid id, std::string name) {
 *         Person person(std::move(id), std::move(name));
 *         person.remind<PersonCreated>(person.id().get(), person.name_);
 *         return person;
 *     }
 * };
 *
 * auto person = Person::create(Guid("p-1"), "Ada");
 * EventBus::instance().trigger(person);
 * @endcode
 */
template<typename Derived>
class AggregateRoot {
public:
    // ========== 标识 ==========

    const Maybe<Guid>& id() const { return id_; }
    bool hasId() const { return id_.isSome(); }

    /**
     * @brief 分配标识，已分配时抛出 ValidationException
     */
    Derived& assignId(Guid id) {
        if (id_.isSome()) {
            throw ValidationException("Aggregate already has id " + id_.get().toString());
        }
        id_ = Maybe<Guid>::just(std::move(id));
        return self();
    }

    // ========== 事件 ==========

    /**
     * @brief 登记待分发的事件
     */
    Derived& remind(std::unique_ptr<DomainEvent> event) {
        if (!event) {
            throw ValidationException("Cannot remind a null event");
        }
        pendingEvents_.push_back(std::move(event));
        return self();
    }

    template<typename E, typename... Args>
    Derived& remind(Args&&... args) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");
        return remind(std::make_unique<E>(std::forward<Args>(args)...));
    }

    const std::vector<std::unique_ptr<DomainEvent>>& pendingEvents() const { return pendingEvents_; }
    bool hasPendingEvents() const { return !pendingEvents_.empty(); }
    void clearEvents() { pendingEvents_.clear(); }

    /**
     * @brief 取走全部待分发事件，队列随之清空
     */
    std::vector<std::unique_ptr<DomainEvent>> takeEvents() {
        return std::exchange(pendingEvents_, {});
    }

protected:
    AggregateRoot() = default;

    explicit AggregateRoot(Guid id)
        : id_(Maybe<Guid>::just(std::move(id))) {}

    Derived& self() { return static_cast<Derived&>(*this); }
    const Derived& self() const { return static_cast<const Derived&>(*this); }

private:
    Maybe<Guid> id_;
    std::vector<std::unique_ptr<DomainEvent>> pendingEvents_;
};
