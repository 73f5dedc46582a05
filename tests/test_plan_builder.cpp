#include <gtest/gtest.h>
#include "query/plan_builder.h"

using namespace rolodex;
using namespace rolodex::query;

class PlanBuilderTest : public ::testing::Test {
protected:
    const schema::SchemaRegistry& registry = schema::SchemaRegistry::contacts();
    QueryPlanBuilder builder{registry};

    QueryPlanPtr buildOk(const RawParams& params, EntityKind entity = EntityKind::APP_USER) {
        auto [st, plan] = builder.build(entity, params);
        EXPECT_TRUE(st.ok()) << st.toString();
        return plan;
    }

    PlanStatus buildErr(const RawParams& params, EntityKind entity = EntityKind::APP_USER) {
        auto [st, plan] = builder.build(entity, params);
        EXPECT_EQ(plan, nullptr);
        return st;
    }
};

TEST_F(PlanBuilderTest, CompilesFiltersOrderingSearchAndPage) {
    auto plan = buildOk({
        {"first_name__icontains", "John"},
        {"relationship__points__gte", "1000"},
        {"ordering", "-relationship.points,last_name"},
        {"search", "Berlin"},
        {"page", "2"},
        {"page_size", "50"},
    });
    ASSERT_NE(plan, nullptr);

    ASSERT_EQ(plan->filters().size(), 2u);
    // RawParams is ordered by key
    EXPECT_EQ(plan->filters()[0].field, "first_name");
    EXPECT_EQ(plan->filters()[0].op, FilterOp::CONTAINS);
    EXPECT_EQ(std::get<std::string>(plan->filters()[0].value), "John");
    EXPECT_EQ(plan->filters()[1].field, "relationship.points");
    EXPECT_EQ(plan->filters()[1].op, FilterOp::GTE);
    EXPECT_EQ(std::get<int64_t>(plan->filters()[1].value), 1000);

    ASSERT_EQ(plan->order().size(), 2u);
    EXPECT_EQ(plan->order()[0].field, "relationship.points");
    EXPECT_EQ(plan->order()[0].direction, SortDirection::DESC);
    EXPECT_EQ(plan->order()[1].field, "last_name");
    EXPECT_EQ(plan->order()[1].direction, SortDirection::ASC);

    ASSERT_TRUE(plan->search().has_value());
    EXPECT_EQ(plan->search()->term, "Berlin");
    EXPECT_FALSE(plan->search()->fields.empty());

    EXPECT_EQ(plan->pagination().page, 2);
    EXPECT_EQ(plan->pagination().page_size, 50);
    EXPECT_EQ(plan->pagination().startIndex(), 50);
}

TEST_F(PlanBuilderTest, DefaultOrderingAndPagination) {
    auto plan = buildOk({});
    ASSERT_NE(plan, nullptr);
    ASSERT_EQ(plan->order().size(), 1u);
    EXPECT_EQ(plan->order()[0].field, "created");
    EXPECT_EQ(plan->order()[0].direction, SortDirection::DESC);
    EXPECT_EQ(plan->pagination().page, 1);
    EXPECT_EQ(plan->pagination().page_size, 50);
    EXPECT_TRUE(plan->filters().empty());
    EXPECT_FALSE(plan->search().has_value());
}

TEST_F(PlanBuilderTest, DoubleUnderscoreAndDotPathsAreEquivalent) {
    auto a = buildOk({{"ordering", "address__city"}});
    auto b = buildOk({{"ordering", "address.city"}});
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(*a, *b);
}

TEST_F(PlanBuilderTest, BuildIsDeterministic) {
    RawParams params = {{"gender", "M"}, {"ordering", "-created"}, {"search", "anna"}};
    auto a = buildOk(params);
    auto b = buildOk(params);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(a->toJson(), b->toJson());
}

TEST_F(PlanBuilderTest, UnknownFilterFieldFails) {
    auto st = buildErr({{"password", "secret"}});
    EXPECT_EQ(st.code, PlanStatus::Code::UNKNOWN_FIELD);
    EXPECT_EQ(st.field, "password");
}

TEST_F(PlanBuilderTest, UnknownOrderingFieldFails) {
    auto st = buildErr({{"ordering", "-nonexistent"}});
    EXPECT_EQ(st.code, PlanStatus::Code::UNKNOWN_FIELD);
    EXPECT_EQ(st.field, "nonexistent");
}

TEST_F(PlanBuilderTest, NonOrderableFieldFails) {
    auto st = buildErr({{"ordering", "address__street"}});
    EXPECT_EQ(st.code, PlanStatus::Code::UNKNOWN_FIELD);
}

TEST_F(PlanBuilderTest, InvalidIntegerValueFails) {
    auto st = buildErr({{"relationship__points__gte", "lots"}});
    EXPECT_EQ(st.code, PlanStatus::Code::VALIDATION_ERROR);
    EXPECT_EQ(st.field, "relationship.points");
}

TEST_F(PlanBuilderTest, InvalidDateValueFails) {
    auto st = buildErr({{"created__gte", "2024-02-30"}});
    EXPECT_EQ(st.code, PlanStatus::Code::VALIDATION_ERROR);
}

TEST_F(PlanBuilderTest, DateFilterParsesIso) {
    auto plan = buildOk({{"created__lt", "2021-01-01"}});
    ASSERT_NE(plan, nullptr);
    ASSERT_EQ(plan->filters().size(), 1u);
    EXPECT_EQ(plan->filters()[0].type, FieldType::DATE);
    EXPECT_EQ(std::get<int64_t>(plan->filters()[0].value), 1609459200);
}

TEST_F(PlanBuilderTest, OperatorMustFitFieldType) {
    // Ordered comparison on a string
    auto st = buildErr({{"first_name__gte", "A"}});
    EXPECT_EQ(st.code, PlanStatus::Code::VALIDATION_ERROR);
    // Substring match on an integer
    st = buildErr({{"relationship__points__icontains", "5"}});
    EXPECT_EQ(st.code, PlanStatus::Code::VALIDATION_ERROR);
}

TEST_F(PlanBuilderTest, RangeFilter) {
    auto plan = buildOk({{"relationship__points__range", "100,200"}});
    ASSERT_NE(plan, nullptr);
    const auto& f = plan->filters().at(0);
    EXPECT_EQ(f.op, FilterOp::RANGE);
    EXPECT_EQ(std::get<int64_t>(f.value), 100);
    EXPECT_EQ(std::get<int64_t>(f.upper), 200);

    EXPECT_EQ(buildErr({{"relationship__points__range", "200,100"}}).code, PlanStatus::Code::VALIDATION_ERROR);
    EXPECT_EQ(buildErr({{"relationship__points__range", "100"}}).code, PlanStatus::Code::VALIDATION_ERROR);
}

TEST_F(PlanBuilderTest, EmptyFilterValuesAreIgnored) {
    auto plan = buildOk({{"first_name", ""}, {"gender", "  "}});
    ASSERT_NE(plan, nullptr);
    EXPECT_TRUE(plan->filters().empty());
}

TEST_F(PlanBuilderTest, PageSizeIsClamped) {
    auto plan = buildOk({{"page_size", "100000"}, {"page", "0"}});
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(plan->pagination().page_size, 1000);
    EXPECT_EQ(plan->pagination().page, 1);

    plan = buildOk({{"page_size", "-5"}});
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(plan->pagination().page_size, 1);
}

TEST_F(PlanBuilderTest, MalformedPageIsValidationError) {
    auto st = buildErr({{"page", "two"}});
    EXPECT_EQ(st.code, PlanStatus::Code::VALIDATION_ERROR);
    EXPECT_EQ(st.field, "page");
}

TEST_F(PlanBuilderTest, OffsetLimitPagination) {
    auto plan = buildOk({{"offset", "120"}, {"limit", "40"}});
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(plan->pagination().mode, Pagination::Mode::OFFSET);
    EXPECT_EQ(plan->pagination().startIndex(), 120);
    EXPECT_EQ(plan->pagination().maxRows(), 40);
    EXPECT_EQ(plan->pagination().page, 4);
}

TEST_F(PlanBuilderTest, NameParameterMatchesNameFields) {
    auto plan = buildOk({{"name", "john"}});
    ASSERT_NE(plan, nullptr);
    ASSERT_TRUE(plan->nameMatch().has_value());
    EXPECT_EQ(plan->nameMatch()->fields, (std::vector<std::string>{"first_name", "last_name"}));

    // Addresses have no name fields
    EXPECT_EQ(buildErr({{"name", "john"}}, EntityKind::ADDRESS).code, PlanStatus::Code::UNKNOWN_FIELD);
}

TEST_F(PlanBuilderTest, CancelParameterIsReserved) {
    auto plan = buildOk({{"_cancel", "1"}});
    ASSERT_NE(plan, nullptr);
    EXPECT_TRUE(plan->filters().empty());
}

TEST_F(PlanBuilderTest, WithPageLeavesOriginalUntouched) {
    auto plan = buildOk({{"page_size", "10"}});
    ASSERT_NE(plan, nullptr);
    QueryPlan third = plan->withPage(3);
    EXPECT_EQ(third.pagination().page, 3);
    EXPECT_EQ(third.pagination().startIndex(), 20);
    EXPECT_EQ(plan->pagination().page, 1);
    EXPECT_EQ(third.order(), plan->order());
}

TEST_F(PlanBuilderTest, SplitFilterKey) {
    EXPECT_EQ(QueryPlanBuilder::splitFilterKey("relationship__points__gte"),
              (std::pair<std::string, std::string>{"relationship.points", "gte"}));
    EXPECT_EQ(QueryPlanBuilder::splitFilterKey("address__city"),
              (std::pair<std::string, std::string>{"address.city", ""}));
    EXPECT_EQ(QueryPlanBuilder::splitFilterKey("gender"),
              (std::pair<std::string, std::string>{"gender", ""}));
}

TEST_F(PlanBuilderTest, PageCountIsAtLeastOne) {
    auto p = Pagination::byPage(1, 1000);
    EXPECT_EQ(p.pageCount(0), 1);
    EXPECT_EQ(p.pageCount(1000), 1);
    EXPECT_EQ(p.pageCount(1001), 2);
}
