#include "storage/sample_data.h"
#include "query/plan_evaluator.h"
#include "utils/logger.h"

#include <algorithm>
#include <iterator>
#include <random>
#include <fmt/format.h>

namespace rolodex {

namespace {

const std::vector<std::string> kFirstNames = {
    "Anna", "Ben", "Clara", "David", "Emma", "Felix", "Greta", "Hans", "Ida", "Jonas",
    "Karl", "Lena", "Max", "Nora", "Oskar", "Paula", "Quentin", "Rosa", "Stefan", "Tina",
    "Uwe", "Vera", "Walter", "Xenia", "Yara", "Zoe", "Maria", "Peter", "Laura", "Thomas",
};

const std::vector<std::string> kLastNames = {
    "Mueller", "Schmidt", "Schneider", "Fischer", "Weber", "Meyer", "Wagner", "Becker",
    "Schulz", "Hoffmann", "Koch", "Richter", "Klein", "Wolf", "Neumann", "Schwarz",
    "Braun", "Zimmermann", "Hartmann", "Lange",
};

struct City {
    const char* name;
    const char* code;
    const char* country;
};

const std::vector<City> kCities = {
    {"Berlin", "10115", "Germany"},   {"Hamburg", "20095", "Germany"},
    {"Munich", "80331", "Germany"},   {"Cologne", "50667", "Germany"},
    {"Frankfurt", "60311", "Germany"}, {"Stuttgart", "70173", "Germany"},
    {"Vienna", "1010", "Austria"},    {"Graz", "8010", "Austria"},
    {"Zurich", "8001", "Switzerland"}, {"Basel", "4001", "Switzerland"},
};

const std::vector<std::string> kStreets = {
    "Hauptstrasse", "Bahnhofstrasse", "Gartenweg", "Schulstrasse", "Lindenallee",
    "Bergstrasse", "Kirchplatz", "Ringstrasse", "Muehlenweg", "Parkstrasse",
};

const std::vector<std::string> kGenders = {"M", "F", "O"};

constexpr int64_t kBirthdayBase = -631152000;  // 1950-01-01
constexpr int64_t kDay = 24 * 3600;

std::vector<std::string> withoutMarker(const std::vector<std::string>& pool, const std::string& marker) {
    std::vector<std::string> out;
    std::copy_if(pool.begin(), pool.end(), std::back_inserter(out), [&](const std::string& name) {
        return marker.empty() || !query::PlanEvaluator::containsIgnoreCase(name, marker);
    });
    if (out.empty()) out.push_back("Contact");
    return out;
}

} // namespace

SampleDataGenerator::SampleDataGenerator() : SampleDataGenerator(Config{}) {}

SampleDataGenerator::SampleDataGenerator(Config config) : config_(std::move(config)) {
    config_.users = std::max<int64_t>(0, config_.users);
    config_.marker_count = std::clamp<int64_t>(config_.marker_count, 0, config_.users);
    config_.created_span_seconds = std::max<int64_t>(1, config_.created_span_seconds);
}

SampleDataGenerator::Dataset SampleDataGenerator::generate() const {
    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    auto pick = [&rng](const auto& pool) -> const auto& {
        return pool[std::uniform_int_distribution<size_t>(0, pool.size() - 1)(rng)];
    };
    auto between = [&rng](int64_t lo, int64_t hi) {
        return std::uniform_int_distribution<int64_t>(lo, hi)(rng);
    };

    const auto firstNames = withoutMarker(kFirstNames, config_.marker_first_name);
    const auto lastNames = withoutMarker(kLastNames, config_.marker_first_name);

    Dataset data;
    data.users.reserve(static_cast<size_t>(config_.users));

    int64_t nextMarker = 0;
    for (int64_t i = 0; i < config_.users; ++i) {
        Record user;
        user.id = i + 1;

        const bool marker = nextMarker < config_.marker_count &&
                            i == nextMarker * config_.users / config_.marker_count;
        if (marker) ++nextMarker;

        const int64_t created = config_.base_created + between(0, config_.created_span_seconds - 1);
        user.fields["first_name"] = marker ? config_.marker_first_name : pick(firstNames);
        user.fields["last_name"] = pick(lastNames);
        user.fields["gender"] = unit(rng) < 0.1 ? FieldValue{} : FieldValue{pick(kGenders)};
        // Multiplying by an odd constant is a bijection modulo 2^48
        const uint64_t mixed = (static_cast<uint64_t>(user.id) * 0x9E3779B97F4A7C15ull) & 0xFFFFFFFFFFFFull;
        user.fields["customer_id"] = fmt::format("CUST-{:012X}", mixed);
        user.fields["phone_number"] = unit(rng) < 0.15
            ? FieldValue{}
            : FieldValue{fmt::format("+49 {} {:07d}", between(30, 899), between(0, 9999999))};
        user.fields["created"] = created;
        user.fields["birthday"] = unit(rng) < 0.2 ? FieldValue{} : FieldValue{kBirthdayBase + between(0, 55 * 365) * kDay};
        user.fields["last_updated"] = created + between(0, 30 * kDay);

        if (unit(rng) < config_.address_ratio) {
            Record address;
            address.id = static_cast<int64_t>(data.addresses.size()) + 1;
            const City& city = pick(kCities);
            address.fields["street"] = pick(kStreets);
            address.fields["street_number"] = std::to_string(between(1, 200));
            address.fields["city_code"] = std::string(city.code);
            address.fields["city"] = std::string(city.name);
            address.fields["country"] = std::string(city.country);
            user.fields["address_id"] = address.id;
            data.addresses.push_back(std::move(address));
        } else {
            user.fields["address_id"] = FieldValue{};
        }

        if (unit(rng) < config_.relationship_ratio) {
            Record rel;
            rel.id = static_cast<int64_t>(data.relationships.size()) + 1;
            const int64_t relCreated = created + between(0, 30 * kDay);
            rel.fields["appuser_id"] = user.id;
            rel.fields["points"] = between(0, 10000);
            rel.fields["created"] = relCreated;
            rel.fields["last_activity"] = relCreated + between(0, 365 * kDay);
            data.relationships.push_back(std::move(rel));
        }

        data.users.push_back(std::move(user));
    }
    return data;
}

StoreStatus SampleDataGenerator::seed(RowStore& store) const {
    Dataset data = generate();

    auto st = store.putRecords(EntityKind::ADDRESS, data.addresses);
    if (!st.ok()) return st;
    st = store.putRecords(EntityKind::CUSTOMER_RELATIONSHIP, data.relationships);
    if (!st.ok()) return st;
    st = store.putRecords(EntityKind::APP_USER, data.users);
    if (!st.ok()) return st;

    ROLODEX_INFO("Seeded {} store: {} users, {} addresses, {} relationships (seed {})",
                 store.name(), data.users.size(), data.addresses.size(), data.relationships.size(),
                 config_.seed);
    return StoreStatus::OK();
}

} // namespace rolodex
