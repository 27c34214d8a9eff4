#pragma once

#include "Aggregate.hpp"

/**
 * @brief 事件处理器类型
 */
using EventHandler = std::function<void(const DomainEvent&)>;

/**
 * @brief 处理器标识，用于 unbind
 */
using HandlerId = uint64_t;

class EventBus;

/**
 * @brief 事件处理模块接口，在 setup 中把自己关心的处理函数绑定到总线
 *
 * @code
 * class WelcomeMailer : public IEventHandler {
 * public:
 *     void setup(EventBus& bus) override {
 *         bus.bind<PersonCreated>([this](const PersonCreated& e) { send(e.name); });
 *     }
 * };
 *
 * WelcomeMailer mailer;
 * EventBus::instance().subscribe(mailer);
 * @endcode
 */
class IEventHandler {
public:
    virtual ~IEventHandler() = default;
    virtual void setup(EventBus& bus) = 0;
};

/**
 * @brief 事件总线 - 按事件类型绑定处理器，同步分发
 *
 * - 处理器按事件的动态类型匹配，同一类型按绑定顺序调用
 * - 分发时先在读锁下复制处理器列表，再在锁外调用（处理器内可以再绑定）
 * - 处理器抛出的异常记录后原样向上传播，不重试
 *
 * 使用示例：
 * @code
 * // 绑定（在初始化时）
 * EventBus::instance().bind<PersonCreated>([](const PersonCreated& e) {
 *     LOG_INFO << "Person created: " << e.name;
 * });
 *
 * // 分发聚合根登记的事件
 * person.remind<PersonCreated>(id, "Ada");
 * EventBus::instance().trigger(person);
 * @endcode
 */
class EventBus {
public:
    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    static EventBus& instance() {
        static EventBus bus;
        return bus;
    }

    // ========== 绑定 ==========

    template<typename E>
    HandlerId bind(std::function<void(const E&)> handler) {
        static_assert(std::is_base_of_v<DomainEvent, E>, "E must derive from DomainEvent");
        if (!handler) {
            throw ValidationException("Cannot bind an empty event handler");
        }

        std::unique_lock lock(mutex_);
        HandlerId id = ++lastId_;
        handlers_[std::type_index(typeid(E))].push_back({
            id,
            [handler = std::move(handler)](const DomainEvent& e) {
                handler(static_cast<const E&>(e));
            }
        });
        LOG_DEBUG << "EventBus: Bound handler #" << id << " to " << typeid(E).name();
        return id;
    }

    /**
     * @return 是否找到并移除
     */
    bool unbind(HandlerId id) {
        std::unique_lock lock(mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            auto& bindings = it->second;
            auto found = std::find_if(bindings.begin(), bindings.end(), [id](const Binding& binding) {
                return binding.id == id;
            });
            if (found != bindings.end()) {
                bindings.erase(found);
                if (bindings.empty()) handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    /**
     * @brief 让处理模块在本总线上完成绑定
     * @note 处理模块的生命周期由调用方保证不短于其绑定
     */
    void subscribe(IEventHandler& handler) {
        handler.setup(*this);
        LOG_DEBUG << "EventBus: Subscribed " << typeid(handler).name();
    }

    /**
     * @brief 注销所有事件处理器（关闭时调用）
     */
    void unbindAll() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
        LOG_INFO << "EventBus: All handlers unbound";
    }

    template<typename E>
    size_t handlerCount() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

    // ========== 分发 ==========

    /**
     * @brief 把单个事件分发给其类型绑定的全部处理器
     */
    void publish(const DomainEvent& event) {
        std::vector<EventHandler> handlers;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(event)));
            if (it != handlers_.end()) {
                for (const auto& binding : it->second) {
                    handlers.push_back(binding.handler);
                }
            }
        }

        LOG_TRACE << "EventBus: Publishing " << event.type << " for " << event.aggregateType
                  << "#" << event.aggregateId.toString() << " to " << handlers.size() << " handler(s)";

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR << "EventBus: Handler failed for " << event.type << ": " << e.what();
                throw;
            }
        }
    }

    /**
     * @brief 按顺序分发一组事件，遇到处理器异常时停止
     * @return 已完成分发的事件数
     */
    size_t publishAll(const std::vector<std::unique_ptr<DomainEvent>>& events) {
        size_t dispatched = 0;
        for (const auto& event : events) {
            if (!event) continue;
            publish(*event);
            ++dispatched;
        }
        return dispatched;
    }

    /**
     * @brief 取走聚合根登记的全部事件并按登记顺序分发
     *
     * 队列在分发之前清空；处理器抛出异常时，本轮剩余事件丢弃，异常向上传播。
     * @return 已完成分发的事件数
     */
    template<typename D>
    size_t trigger(AggregateRoot<D>& aggregate) {
        auto events = aggregate.takeEvents();
        if (events.empty()) return 0;

        LOG_DEBUG << "EventBus: Triggering " << events.size() << " event(s) for aggregate "
                  << aggregate.id().map([](const Guid& id) { return id.toString(); }).getOr("<unassigned>");
        return publishAll(events);
    }

private:
    struct Binding {
        HandlerId id;
        EventHandler handler;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::type_index, std::vector<Binding>> handlers_;
    HandlerId lastId_ = 0;
};
