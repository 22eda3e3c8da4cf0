#include "./config.hpp"
#include "./database.hpp"
#include "./test_types.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace {

using ProvDB::DatabaseConfig;
using ProvDB::loadJsonIntoConfig;

TEST(Config, Defaults) {
	DatabaseConfig conf;
	EXPECT_TRUE(conf.compress);
	EXPECT_FALSE(conf.verbose);
	EXPECT_EQ(conf.allowed_namespaces, (std::vector<std::string>{"provdb", "renku"}));
}

TEST(Config, LoadsKnownKeys) {
	const auto j = nlohmann::json::parse(R"({
		"provdb": {
			"storage_path": "/tmp/somewhere",
			"compress": false,
			"verbose": true,
			"allowed_namespaces": ["renku", "plugins"]
		},
		"other_tool": {"x": 1}
	})");

	DatabaseConfig conf;
	ASSERT_TRUE(loadJsonIntoConfig(j, conf));
	EXPECT_EQ(conf.storage_path, "/tmp/somewhere");
	EXPECT_FALSE(conf.compress);
	EXPECT_TRUE(conf.verbose);
	EXPECT_EQ(conf.allowed_namespaces, (std::vector<std::string>{"renku", "plugins"}));
}

TEST(Config, MissingSectionKeepsDefaults) {
	DatabaseConfig conf;
	ASSERT_TRUE(loadJsonIntoConfig(nlohmann::json::object(), conf));
	EXPECT_EQ(conf.storage_path, DatabaseConfig{}.storage_path);
}

TEST(Config, RejectsWrongTypes) {
	DatabaseConfig conf;
	EXPECT_FALSE(loadJsonIntoConfig(nlohmann::json::array(), conf));
	EXPECT_FALSE(loadJsonIntoConfig(nlohmann::json{{"provdb", 1}}, conf));
	EXPECT_FALSE(loadJsonIntoConfig(nlohmann::json{{"provdb", {{"compress", "yes"}}}}, conf));
	EXPECT_FALSE(loadJsonIntoConfig(nlohmann::json{{"provdb", {{"storage_path", 3}}}}, conf));
	EXPECT_FALSE(loadJsonIntoConfig(nlohmann::json{{"provdb", {{"allowed_namespaces", {"renku", 2}}}}}, conf));
}

TEST(Config, NamespacesLimitWhatCanBeRead) {
	ProvDB::Test::TempDir dir{"config_namespaces"};

	{
		ProvDB::Database db{ProvDB::Test::testConfig(dir)};
		ProvDB::Test::registerTestTypes(db.types());
		db.registerObject(db.create<ProvDB::Test::Item>(ProvDB::Test::Item{"/items/a", "a"}).entity());
		db.commit();
	}

	DatabaseConfig conf = ProvDB::Test::testConfig(dir);
	conf.allowed_namespaces = {"plugins"};
	ProvDB::Database db{conf};

	// "renku" is not trusted by this database, so the test types can not even be registered
	EXPECT_THROW(ProvDB::Test::registerTestTypes(db.types()), ProvDB::InvariantViolation);
	EXPECT_THROW(db.getByID("/items/a"), ProvDB::DisallowedType);
}

} // namespace
