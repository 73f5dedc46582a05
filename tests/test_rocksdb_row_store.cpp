#include <gtest/gtest.h>
#include "query/plan_builder.h"
#include "storage/memory_row_store.h"
#include "storage/rocksdb_row_store.h"
#include "storage/sample_data.h"

#include <filesystem>

using namespace rolodex;
using namespace rolodex::query;

class RocksDBRowStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_path_ = "./data/rolodex_rocksdb_store_test";
        std::filesystem::remove_all(test_db_path_);

        RocksDBWrapper::Config config;
        config.db_path = test_db_path_;
        config.memtable_size_mb = 16;
        config.block_cache_size_mb = 16;
        store_ = std::make_shared<RocksDBRowStore>(config);
        ASSERT_TRUE(store_->open());
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(test_db_path_);
    }

    StoreRequest request(const RawParams& params) {
        auto [st, plan] = builder_.build(EntityKind::APP_USER, params);
        EXPECT_TRUE(st.ok()) << st.toString();
        StoreRequest r;
        r.plan = plan;
        return r;
    }

    std::string test_db_path_;
    std::shared_ptr<RocksDBRowStore> store_;
    QueryPlanBuilder builder_{schema::SchemaRegistry::contacts()};
};

TEST_F(RocksDBRowStoreTest, PutAndFindRecord) {
    Record r;
    r.id = 42;
    r.fields["city"] = std::string("Vienna");
    r.fields["country"] = std::string("Austria");
    ASSERT_TRUE(store_->putRecord(EntityKind::ADDRESS, r).ok());

    auto found = store_->findRecord(EntityKind::ADDRESS, 42);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, 42);
    EXPECT_EQ(std::get<std::string>(found->get("city")), "Vienna");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(found->get("street")));
}

TEST_F(RocksDBRowStoreTest, ResolvesReverseRelationThroughIndex) {
    Record rel;
    rel.id = 5;
    rel.fields["appuser_id"] = int64_t{7};
    rel.fields["points"] = int64_t{1234};
    ASSERT_TRUE(store_->putRecord(EntityKind::CUSTOMER_RELATIONSHIP, rel).ok());

    Record u;
    u.id = 7;
    u.fields["first_name"] = std::string("John");
    u.fields["created"] = int64_t{1600000000};
    ASSERT_TRUE(store_->putRecord(EntityKind::APP_USER, u).ok());

    auto [st, result] = store_->execute(request({}));
    ASSERT_TRUE(st.ok()) << st.message;
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(result.rows[0].get("relationship.points")), 1234);
    EXPECT_EQ(std::get<int64_t>(result.rows[0].get("relationship.id")), 5);
}

TEST_F(RocksDBRowStoreTest, AgreesWithMemoryStore) {
    SampleDataGenerator::Config cfg;
    cfg.users = 300;
    cfg.marker_count = 7;
    SampleDataGenerator generator(cfg);

    MemoryRowStore memory;
    ASSERT_TRUE(generator.seed(memory).ok());
    ASSERT_TRUE(generator.seed(*store_).ok());

    const std::vector<RawParams> queries = {
        {{"ordering", "-relationship__points,last_name,first_name"}, {"page_size", "25"}, {"page", "3"}},
        {{"address__city__icontains", "berlin"}, {"ordering", "-relationship__points"}},
        {{"search", "John"}},
        {{"gender", "M"}, {"relationship__points__gte", "5000"}, {"ordering", "address__country,address__city,-created"}},
    };

    for (const auto& params : queries) {
        auto req = request(params);
        auto [mst, expected] = memory.execute(req);
        auto [rst, actual] = store_->execute(req);
        ASSERT_TRUE(mst.ok());
        ASSERT_TRUE(rst.ok()) << rst.message;
        EXPECT_EQ(actual.total_count, expected.total_count);
        ASSERT_EQ(actual.rows.size(), expected.rows.size());
        for (size_t i = 0; i < actual.rows.size(); ++i) {
            EXPECT_EQ(actual.rows[i].id, expected.rows[i].id);
            EXPECT_EQ(actual.rows[i].values, expected.rows[i].values);
        }
    }
}

TEST_F(RocksDBRowStoreTest, RecordsSurviveReopen) {
    Record r;
    r.id = 1;
    r.fields["city"] = std::string("Graz");
    ASSERT_TRUE(store_->putRecord(EntityKind::ADDRESS, r).ok());
    store_->close();
    EXPECT_FALSE(store_->isOpen());

    ASSERT_TRUE(store_->open());
    auto found = store_->findRecord(EntityKind::ADDRESS, 1);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(std::get<std::string>(found->get("city")), "Graz");
}

TEST_F(RocksDBRowStoreTest, ClosedStoreReportsError) {
    store_->close();
    auto [st, result] = store_->count(request({}));
    EXPECT_EQ(st.code, StoreStatus::Code::ERROR);
}

TEST_F(RocksDBRowStoreTest, AbortedScan) {
    Record u;
    u.id = 1;
    ASSERT_TRUE(store_->putRecord(EntityKind::APP_USER, u).ok());

    auto req = request({});
    req.abort_signal = std::make_shared<std::atomic<bool>>(true);
    auto [st, result] = store_->execute(req);
    EXPECT_EQ(st.code, StoreStatus::Code::ABORTED);
}
