#pragma once

#include "common/domain/Domain.hpp"
#include "common/guard/GuardEvaluator.hpp"

struct PersonCreated : DomainEvent {
    std::string name;

    PersonCreated(Guid id, std::string personName)
        : DomainEvent("PersonCreated", std::move(id), "Person")
        , name(std::move(personName)) {}
};

struct PersonRenamed : DomainEvent {
    std::string oldName;
    std::string newName;

    PersonRenamed(Guid id, std::string from, std::string to)
        : DomainEvent("PersonRenamed", std::move(id), "Person")
        , oldName(std::move(from))
        , newName(std::move(to)) {}
};

struct PersonRetired : DomainEvent {
    explicit PersonRetired(Guid id)
        : DomainEvent("PersonRetired", std::move(id), "Person") {}
};

/**
 * @brief 测试用聚合根：创建时验证参数，变更时登记事件
 */
class Person : public AggregateRoot<Person> {
public:
    static Result<Person, FailureReport> create(const Guid& id, const std::string& name, int age) {
        Json::Value values;
        values["name"] = name;
        values["age"] = age;

        static const ValidationSpec spec{
            {"name", "required|between[1, 50]"},
            {"age", "ge[0]|lt[150]"},
        };

        return validate(values, spec).map([&] {
            Person person(id, name, age);
            person.remind<PersonCreated>(id, name);
            return person;
        });
    }

    Person& rename(const std::string& newName) {
        GuardEvaluator().check("name", newName, "required|between[1, 50]").throwIfInvalid();
        std::string oldName = std::exchange(name_, newName);
        return remind<PersonRenamed>(id().get(), oldName, newName);
    }

    Person& retire() {
        return remind<PersonRetired>(id().get());
    }

    const std::string& name() const { return name_; }
    int age() const { return age_; }

private:
    std::string name_;
    int age_;

    Person(Guid id, std::string name, int age)
        : AggregateRoot<Person>(std::move(id))
        , name_(std::move(name))
        , age_(age) {}
};

/**
 * @brief 未分配标识的聚合根
 */
class Draft : public AggregateRoot<Draft> {};
