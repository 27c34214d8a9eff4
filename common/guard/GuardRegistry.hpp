#pragma once

#include "Guard.hpp"
#include "common/monads/Maybe.hpp"

using GuardFactory = std::function<std::unique_ptr<IGuard>(const GuardRule&)>;

/**
 * @brief 重名注册策略
 */
enum class DuplicatePolicy {
    Error,      // 拒绝并抛出 DuplicateNameException
    Replace     // 覆盖已有定义
};

/**
 * @brief 守卫注册表：规则名称 -> 守卫工厂
 *
 * 注册持有写锁，解析持有读锁；freeze() 之后不再接受注册。
 * 进程级实例由 instance() 提供（已预置内置守卫），也可以为测试或隔离场景单独构造。
 */
class GuardRegistry {
public:
    GuardRegistry() = default;
    GuardRegistry(const GuardRegistry&) = delete;
    GuardRegistry& operator=(const GuardRegistry&) = delete;

    /**
     * @brief 进程级注册表，首次访问时注册内置守卫
     * @note 定义在 BuiltinGuards.hpp，本文件末尾已包含
     */
    static GuardRegistry& instance();

    static Maybe<DuplicatePolicy> parsePolicy(const std::string& text) {
        std::string lower = StringUtils::toLower(StringUtils::trim(text));
        if (lower == "error") return some(DuplicatePolicy::Error);
        if (lower == "replace") return some(DuplicatePolicy::Replace);
        return none();
    }

    // ========== 注册 ==========

    /**
     * @brief 注册守卫工厂，失败时抛出异常
     * @throws RegistryFrozenException 注册表已冻结
     * @throws DuplicateNameException 名称已存在且策略为 Error
     * @throws MalformedRuleException 名称不合法或工厂为空
     */
    void registerGuard(const std::string& name, GuardFactory factory) {
        std::unique_lock lock(mutex_);
        if (frozen_) {
            LOG_WARN << "GuardRegistry: Rejected registration of '" << name << "': registry is frozen";
            throw RegistryFrozenException(name);
        }
        if (!GuardRule::isValidName(name)) {
            throw MalformedRuleException("Invalid guard name: " + name);
        }
        if (!factory) {
            throw MalformedRuleException("Guard factory for " + name + " is empty");
        }

        auto it = guards_.find(name);
        if (it != guards_.end()) {
            if (policy_ == DuplicatePolicy::Error) {
                LOG_WARN << "GuardRegistry: Rejected duplicate guard '" << name << "'";
                throw DuplicateNameException(name);
            }
            it->second = std::move(factory);
            LOG_DEBUG << "GuardRegistry: Replaced guard '" << name << "'";
            return;
        }
        guards_.emplace(name, std::move(factory));
        LOG_DEBUG << "GuardRegistry: Registered guard '" << name << "'";
    }

    /**
     * @brief 注册可由 GuardRule 构造的守卫类
     */
    template<typename G>
    void registerGuard(const std::string& name) {
        static_assert(std::is_base_of_v<IGuard, G>, "G must implement IGuard");
        registerGuard(name, [](const GuardRule& rule) -> std::unique_ptr<IGuard> {
            return std::make_unique<G>(rule);
        });
    }

    void registerPredicate(const std::string& name, const std::string& messageTemplate, GuardPredicate predicate) {
        if (!predicate) {
            throw MalformedRuleException("Guard predicate for " + name + " is empty");
        }
        registerGuard(name, [messageTemplate, predicate = std::move(predicate)](const GuardRule& rule)
                                -> std::unique_ptr<IGuard> {
            return std::make_unique<PredicateGuard>(rule, messageTemplate, predicate);
        });
    }

    /**
     * @brief 不抛异常的注册，失败原因放在 Err 中
     */
    Result<Unit, std::string> tryRegister(const std::string& name, GuardFactory factory) {
        try {
            registerGuard(name, std::move(factory));
        } catch (const AppException& e) {
            return err(e.getMessage());
        }
        return ok();
    }

    /**
     * @brief 移除守卫，冻结后抛出 RegistryFrozenException
     * @return 是否存在并被移除
     */
    bool unregister(const std::string& name) {
        std::unique_lock lock(mutex_);
        if (frozen_) throw RegistryFrozenException(name);
        return guards_.erase(name) > 0;
    }

    void freeze() {
        std::unique_lock lock(mutex_);
        if (frozen_) return;
        frozen_ = true;
        LOG_INFO << "GuardRegistry: Frozen with " << guards_.size() << " guard(s)";
    }

    bool isFrozen() const {
        std::shared_lock lock(mutex_);
        return frozen_;
    }

    void setDuplicatePolicy(DuplicatePolicy policy) {
        std::unique_lock lock(mutex_);
        policy_ = policy;
    }

    DuplicatePolicy duplicatePolicy() const {
        std::shared_lock lock(mutex_);
        return policy_;
    }

    // ========== 查询 ==========

    /**
     * @brief 按规则实例化守卫
     * @throws UnknownGuardException 名称未注册
     * @throws MalformedRuleException 守卫拒绝其参数
     */
    std::unique_ptr<IGuard> resolve(const GuardRule& rule) const {
        GuardFactory factory;
        {
            std::shared_lock lock(mutex_);
            auto it = guards_.find(rule.name);
            if (it == guards_.end()) {
                throw UnknownGuardException(rule.name);
            }
            factory = it->second;
        }

        auto guard = factory(rule);
        if (!guard) {
            throw MalformedRuleException("Guard factory for " + rule.name + " returned no guard");
        }
        return guard;
    }

    bool has(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return guards_.count(name) > 0;
    }

    std::vector<std::string> names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(guards_.size());
        for (const auto& [name, factory] : guards_) {
            result.push_back(name);
        }
        return result;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return guards_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, GuardFactory> guards_;
    DuplicatePolicy policy_ = DuplicatePolicy::Error;
    bool frozen_ = false;
};

// instance() 的定义依赖内置守卫
#include "BuiltinGuards.hpp"
