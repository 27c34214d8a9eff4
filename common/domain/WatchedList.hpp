#pragma once

/**
 * @brief 变更跟踪列表 - 记录相对初始内容新增和移除的元素
 *
 * 聚合根持有的子集合用它包装，仓储只需写入 addedItems() / removedItems() 两部分差异。
 * 子类实现 compare 判断两个元素是否表示同一对象（通常比较标识）。
 *
 * 使用示例：
 * @code
 * class TagList : public WatchedList<Tag> {
 * public:
 *     using WatchedList::WatchedList;
 *     bool compare(const Tag& a, const Tag& b) const override { return a.name == b.name; }
 * };
 *
 * TagList tags(loadedTags);
 * tags.add(Tag{"urgent"});
 * tags.remove(Tag{"draft"});
 * repository.saveTags(tags.addedItems(), tags.removedItems());
 * @endcode
 */
template<typename T>
class WatchedList {
public:
    explicit WatchedList(std::vector<T> items = {})
        : items_(items)
        , original_(std::move(items)) {}

    virtual ~WatchedList() = default;

    virtual bool compare(const T& a, const T& b) const = 0;

    const std::vector<T>& items() const { return items_; }
    const std::vector<T>& originalItems() const { return original_; }
    const std::vector<T>& addedItems() const { return added_; }
    const std::vector<T>& removedItems() const { return removed_; }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    bool exists(const T& item) const {
        return contains(items_, item) || contains(added_, item);
    }

    /**
     * @brief 添加元素
     *
     * 之前移除过的元素从移除列表中撤销；初始内容中没有的元素记入新增列表。
     */
    void add(const T& item) {
        eraseFirst(removed_, item);
        if (!contains(added_, item) && !contains(original_, item)) {
            added_.push_back(item);
        }
        if (!contains(items_, item)) {
            items_.push_back(item);
        }
    }

    /**
     * @brief 移除元素
     *
     * 本次新增的元素只撤销新增；初始内容中的元素记入移除列表。
     */
    void remove(const T& item) {
        eraseFirst(items_, item);

        if (contains(added_, item)) {
            eraseFirst(added_, item);
            return;
        }
        if (contains(original_, item) && !contains(removed_, item)) {
            removed_.push_back(item);
        }
    }

    /**
     * @brief 用新的完整内容替换当前内容，差异按 add / remove 记录
     */
    void update(const std::vector<T>& items) {
        std::vector<T> stale;
        for (const auto& current : items_) {
            if (!contains(items, current)) stale.push_back(current);
        }
        for (const auto& item : stale) {
            remove(item);
        }
        for (const auto& item : items) {
            add(item);
        }
    }

private:
    std::vector<T> items_;
    std::vector<T> original_;
    std::vector<T> added_;
    std::vector<T> removed_;

    bool contains(const std::vector<T>& list, const T& item) const {
        return std::any_of(list.begin(), list.end(), [&](const T& other) { return compare(item, other); });
    }

    void eraseFirst(std::vector<T>& list, const T& item) {
        auto it = std::find_if(list.begin(), list.end(), [&](const T& other) { return compare(item, other); });
        if (it != list.end()) list.erase(it);
    }
};
