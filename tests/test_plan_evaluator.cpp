#include <gtest/gtest.h>
#include "query/plan_builder.h"
#include "query/plan_evaluator.h"

using namespace rolodex;
using namespace rolodex::query;

namespace {

Row makeRow(int64_t id, std::string first, std::string last, FieldValue points, FieldValue city = {}) {
    Row r;
    r.id = id;
    r.values["id"] = id;
    r.values["first_name"] = std::move(first);
    r.values["last_name"] = std::move(last);
    r.values["relationship.points"] = std::move(points);
    r.values["address.city"] = std::move(city);
    return r;
}

std::vector<int64_t> ids(const std::vector<Row>& rows) {
    std::vector<int64_t> out;
    for (const auto& r : rows) out.push_back(r.id);
    return out;
}

} // namespace

class PlanEvaluatorTest : public ::testing::Test {
protected:
    QueryPlanBuilder builder{schema::SchemaRegistry::contacts()};

    QueryPlanPtr plan(const RawParams& params) {
        auto [st, p] = builder.build(EntityKind::APP_USER, params);
        EXPECT_TRUE(st.ok()) << st.toString();
        return p;
    }

    std::vector<Row> rows = {
        makeRow(1, "Anna", "Weber", int64_t{500}, std::string("Berlin")),
        makeRow(2, "John", "Koch", int64_t{9000}, std::string("Hamburg")),
        makeRow(3, "Johnny", "Weber", int64_t{9000}),
        makeRow(4, "Max", "Braun", FieldValue{}, std::string("Berlin")),
        makeRow(5, "Lena", "Weber", int64_t{500}, std::string("Munich")),
    };
};

TEST_F(PlanEvaluatorTest, ContainsIsCaseInsensitive) {
    auto p = plan({{"first_name__icontains", "JOHN"}});
    PlanEvaluator ev(*p);
    std::vector<int64_t> matched;
    for (const auto& r : rows) {
        if (ev.matches(r)) matched.push_back(r.id);
    }
    EXPECT_EQ(matched, (std::vector<int64_t>{2, 3}));
}

TEST_F(PlanEvaluatorTest, NullNeverMatchesAFilter) {
    auto p = plan({{"relationship__points__lte", "100000"}});
    PlanEvaluator ev(*p);
    EXPECT_TRUE(ev.matches(rows[0]));
    EXPECT_FALSE(ev.matches(rows[3]));
}

TEST_F(PlanEvaluatorTest, FiltersAreConjunctive) {
    auto p = plan({{"last_name", "Weber"}, {"relationship__points__gte", "1000"}});
    PlanEvaluator ev(*p);
    EXPECT_FALSE(ev.matches(rows[0]));
    EXPECT_TRUE(ev.matches(rows[2]));
    EXPECT_FALSE(ev.matches(rows[1]));
}

TEST_F(PlanEvaluatorTest, SearchMatchesAnySearchableField) {
    auto p = plan({{"search", "berlin"}});
    PlanEvaluator ev(*p);
    EXPECT_TRUE(ev.matches(rows[0]));
    EXPECT_FALSE(ev.matches(rows[1]));
    EXPECT_TRUE(ev.matches(rows[3]));

    auto byName = plan({{"search", "weber"}});
    PlanEvaluator ev2(*byName);
    EXPECT_TRUE(ev2.matches(rows[2]));
}

TEST_F(PlanEvaluatorTest, NameMatchesFirstOrLastName) {
    auto p = plan({{"name", "koch"}});
    PlanEvaluator ev(*p);
    EXPECT_TRUE(ev.matches(rows[1]));
    EXPECT_FALSE(ev.matches(rows[0]));
}

TEST_F(PlanEvaluatorTest, MultiFieldOrderIsLexicographicWithIdTieBreak) {
    auto p = plan({{"ordering", "-relationship__points,last_name,first_name"}, {"page_size", "10"}});
    PlanEvaluator ev(*p);
    auto page = ev.selectPage(rows);

    // NULL points first descending; 9000: Koch < Weber; 500: Weber/Anna < Weber/Lena
    EXPECT_EQ(ids(page), (std::vector<int64_t>{4, 2, 3, 1, 5}));
}

TEST_F(PlanEvaluatorTest, NullsSortLastAscending) {
    auto p = plan({{"ordering", "relationship__points"}, {"page_size", "10"}});
    PlanEvaluator ev(*p);
    auto page = ev.selectPage(rows);
    EXPECT_EQ(ids(page), (std::vector<int64_t>{1, 5, 2, 3, 4}));
}

TEST_F(PlanEvaluatorTest, EqualKeysFallBackToId) {
    auto p = plan({{"ordering", "last_name"}, {"page_size", "10"}});
    PlanEvaluator ev(*p);
    auto page = ev.selectPage({rows[4], rows[2], rows[0], rows[3], rows[1]});
    EXPECT_EQ(ids(page), (std::vector<int64_t>{4, 2, 1, 3, 5}));
}

TEST_F(PlanEvaluatorTest, SelectPageSlicesAfterOrdering) {
    auto p = plan({{"ordering", "id"}, {"page_size", "2"}, {"page", "2"}});
    PlanEvaluator ev(*p);
    EXPECT_EQ(ids(ev.selectPage(rows)), (std::vector<int64_t>{3, 4}));

    auto last = plan({{"ordering", "id"}, {"page_size", "2"}, {"page", "3"}});
    PlanEvaluator ev3(*last);
    EXPECT_EQ(ids(ev3.selectPage(rows)), (std::vector<int64_t>{5}));
}

TEST_F(PlanEvaluatorTest, PageBeyondEndIsEmpty) {
    auto p = plan({{"page_size", "2"}, {"page", "9"}});
    PlanEvaluator ev(*p);
    EXPECT_TRUE(ev.selectPage(rows).empty());
}

TEST_F(PlanEvaluatorTest, CompareValues) {
    EXPECT_LT(PlanEvaluator::compareValues(int64_t{1}, int64_t{2}), 0);
    EXPECT_EQ(PlanEvaluator::compareValues(std::string("a"), std::string("a")), 0);
    // Bytewise: uppercase before lowercase
    EXPECT_LT(PlanEvaluator::compareValues(std::string("Z"), std::string("a")), 0);
    EXPECT_GT(PlanEvaluator::compareValues(FieldValue{}, int64_t{0}), 0);
    EXPECT_EQ(PlanEvaluator::compareValues(FieldValue{}, FieldValue{}), 0);
}

TEST_F(PlanEvaluatorTest, ContainsIgnoreCaseHelper) {
    EXPECT_TRUE(PlanEvaluator::containsIgnoreCase("Bahnhofstrasse", "HOF"));
    EXPECT_TRUE(PlanEvaluator::containsIgnoreCase("abc", ""));
    EXPECT_FALSE(PlanEvaluator::containsIgnoreCase("ab", "abc"));
}
