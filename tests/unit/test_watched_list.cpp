#include "common/domain/Domain.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

struct Member {
    std::string name;
    int age = 0;
};

class MemberList : public WatchedList<Member> {
public:
    using WatchedList::WatchedList;

    bool compare(const Member& a, const Member& b) const override {
        return a.name == b.name;
    }
};

std::vector<std::string> names(const std::vector<Member>& members) {
    std::vector<std::string> result;
    for (const auto& member : members) {
        result.push_back(member.name);
    }
    return result;
}

using Names = std::vector<std::string>;

}  // namespace

TEST(WatchedList, AddTracksNewItems) {
    MemberList list;
    list.add({"John", 30});
    list.add({"Mary", 25});

    EXPECT_EQ(names(list.items()), (Names{"John", "Mary"}));
    EXPECT_EQ(names(list.addedItems()), (Names{"John", "Mary"}));
    EXPECT_TRUE(list.removedItems().empty());
}

TEST(WatchedList, RemovingNewItemOnlyUndoesAdd) {
    MemberList list;
    list.add({"John", 30});
    list.add({"Mary", 25});
    list.remove({"John", 30});

    EXPECT_EQ(names(list.items()), (Names{"Mary"}));
    EXPECT_EQ(names(list.addedItems()), (Names{"Mary"}));
    EXPECT_TRUE(list.removedItems().empty());
}

TEST(WatchedList, RemovingOriginalItemIsTracked) {
    MemberList list({{"John", 30}, {"Mary", 25}});
    EXPECT_TRUE(list.addedItems().empty());

    list.remove({"John", 0});
    list.remove({"John", 0});

    EXPECT_EQ(names(list.items()), (Names{"Mary"}));
    EXPECT_EQ(names(list.removedItems()), (Names{"John"}));
    EXPECT_EQ(names(list.originalItems()), (Names{"John", "Mary"}));
    EXPECT_FALSE(list.exists({"John", 0}));
}

TEST(WatchedList, ReaddingOriginalItemCancelsRemoval) {
    MemberList list({{"John", 30}});
    list.remove({"John", 30});
    list.add({"John", 31});

    EXPECT_EQ(names(list.items()), (Names{"John"}));
    EXPECT_TRUE(list.addedItems().empty());
    EXPECT_TRUE(list.removedItems().empty());
}

TEST(WatchedList, AddIsIdempotentByIdentity) {
    MemberList list({{"John", 30}});
    list.add({"John", 99});
    list.add({"Ada", 36});
    list.add({"Ada", 37});

    EXPECT_EQ(list.size(), 2u);
    EXPECT_EQ(list.items().front().age, 30);
    EXPECT_EQ(names(list.addedItems()), (Names{"Ada"}));
    EXPECT_TRUE(list.exists({"Ada", 0}));
}

TEST(WatchedList, UpdateRecordsDifference) {
    MemberList list({{"John", 30}, {"Mary", 25}});
    list.update({{"Mary", 25}, {"Ada", 36}});

    EXPECT_EQ(names(list.items()), (Names{"Mary", "Ada"}));
    EXPECT_EQ(names(list.addedItems()), (Names{"Ada"}));
    EXPECT_EQ(names(list.removedItems()), (Names{"John"}));
}
