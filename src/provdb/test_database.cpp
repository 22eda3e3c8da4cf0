#include "./database.hpp"
#include "./test_types.hpp"

#include <gtest/gtest.h>

#include <array>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>

namespace {

using namespace ProvDB;
using namespace ProvDB::Test;

struct Memo {
	std::string text;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Memo, text)

size_t countRecords(const TempDir& dir) {
	size_t count {0};
	for (const auto& entry : std::filesystem::recursive_directory_iterator(dir.path)) {
		if (entry.is_regular_file()) {
			count++;
		}
	}
	return count;
}

bool isZSTDFile(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	std::vector<uint8_t> head(4);
	file.read(reinterpret_cast<char*>(head.data()), head.size());
	return file.gcount() == 4 && head == std::vector<uint8_t>{0x28, 0xB5, 0x2F, 0xFD};
}

struct DatabaseTest : public ::testing::Test {
	TempDir dir{"database"};
	std::unique_ptr<Database> db;

	DatabaseTest(void) {
		reopen();
	}

	Database& reopen(const DatabaseConfig& conf) {
		db = std::make_unique<Database>(conf);
		registerTestTypes(db->types());
		return *db;
	}

	Database& reopen(void) {
		return reopen(testConfig(dir));
	}

	Object item(const std::string& name) {
		return db->create<Item>(Item{"/items/" + name, name}).entity();
	}
};

TEST_F(DatabaseTest, Lifecycle) {
	const Object a = item("a");
	EXPECT_EQ(db->lifecycle(a), ObjectState::UNSAVED);
	EXPECT_EQ(db->oidOf(a), "");

	db->registerObject(a);
	EXPECT_EQ(db->lifecycle(a), ObjectState::PENDING);
	EXPECT_EQ(db->oidOf(a), hashID("/items/a"));

	EXPECT_EQ(db->commit(), 1u);
	EXPECT_EQ(db->lifecycle(a), ObjectState::CLEAN);

	db->modify<Item>(a).name = "renamed";
	EXPECT_EQ(db->lifecycle(a), ObjectState::DIRTY);

	EXPECT_EQ(db->commit(), 1u);
	EXPECT_EQ(db->lifecycle(a), ObjectState::CLEAN);

	reopen();
	EXPECT_EQ(db->state<Item>(db->getByID("/items/a").entity()).name, "renamed");
}

TEST_F(DatabaseTest, OIDsAreHashesOrRandom) {
	const Object a = item("a");
	const Object n1 = db->create<Note>(Note{"x"}).entity();
	const Object n2 = db->create<Note>(Note{"x"}).entity();
	db->registerObject(a);
	db->registerObject(n1);
	db->registerObject(n2);

	EXPECT_EQ(db->oidOf(a), hashID("/items/a"));
	EXPECT_EQ(db->oidOf(a).size(), 64u);

	EXPECT_EQ(db->oidOf(n1).size(), 64u);
	EXPECT_NE(db->oidOf(n1), db->oidOf(n2));
	EXPECT_EQ(db->oidOf(n1).find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(DatabaseTest, RandomOIDsDoNotRepeatAcrossGenerators) {
	// every Database has its own generator, like separate processes sharing a directory
	std::set<std::string> seen;
	for (int i = 0; i < 16; i++) {
		OIDGenerator_128_128 gen;
		const std::string first = gen();
		const std::string second = gen();
		EXPECT_EQ(first.substr(0, 32), second.substr(0, 32)); // same namespace
		EXPECT_NE(first, second);
		EXPECT_TRUE(seen.insert(first.substr(0, 32)).second);
	}

	// fixed namespace, the random half still differs
	const std::array<uint8_t, 16> ns {};
	OIDGenerator_128_128 a{ns};
	OIDGenerator_128_128 b{ns};
	const std::string oid_a = a();
	EXPECT_EQ(oid_a.substr(0, 32), std::string(32, '0'));
	EXPECT_NE(oid_a, b());
}

TEST_F(DatabaseTest, SingleInstancePerOID) {
	db->registerObject(item("a"));
	db->commit();

	reopen();
	const Object first = db->getByID("/items/a").entity();
	const Object second = db->getByID("/items/a").entity();
	const Object third = db->get(hashID("/items/a")).entity();

	EXPECT_EQ(first, second);
	EXPECT_EQ(first, third);
}

TEST_F(DatabaseTest, NotFound) {
	EXPECT_THROW(db->get("nope"), NotFound);
	EXPECT_THROW(db->getByID("/items/nope"), NotFound);
}

TEST_F(DatabaseTest, RootResolvesOnEmptyStorage) {
	ASSERT_FALSE(db->storage().exists("root"));

	const ObjectHandle root = db->get("root");
	EXPECT_EQ(db->typeOf(root.entity()), "provdb.Root");
	EXPECT_EQ(db->oidOf(root.entity()), "root");
	EXPECT_EQ(db->get("root").entity(), root.entity());
	EXPECT_TRUE(db->rootEntries().empty());

	db->addIndex<Item>("items", "name");
	db->commit();

	reopen();
	const ObjectHandle stored_root = db->get("root");
	EXPECT_EQ(db->typeOf(stored_root.entity()), "provdb.Root");
	EXPECT_EQ(db->lifecycle(stored_root.entity()), ObjectState::CLEAN);
	EXPECT_EQ(stored_root.get<DBComp::Root>().entries.count("items"), 1u);
}

TEST_F(DatabaseTest, GhostMaterialization) {
	{
		const Object leaf = db->create<Node>(Node{"/nodes/leaf", "leaf", entt::null, {}}).entity();
		const Object top = db->create<Node>(Node{"/nodes/top", "top", entt::null, {leaf}}).entity();
		db->registerObject(top);
		db->commit();
	}

	reopen();
	const Object top = db->getByID("/nodes/top").entity();
	const Object ghost = db->state<Node>(top).children.at(0);

	// identity before state
	EXPECT_EQ(db->lifecycle(ghost), ObjectState::GHOST);
	EXPECT_EQ(db->oidOf(ghost), hashID("/nodes/leaf"));
	EXPECT_EQ(db->typeOf(ghost), "renku.test.Node");
	EXPECT_FALSE(db->registry().all_of<Node>(ghost));

	// looking it up resolves to the ghost itself
	EXPECT_EQ(db->getByID("/nodes/leaf").entity(), ghost);

	EXPECT_EQ(db->state<Node>(ghost).label, "leaf");
	EXPECT_EQ(db->lifecycle(ghost), ObjectState::CLEAN);
	EXPECT_EQ(db->getByID("/nodes/leaf").entity(), ghost);
}

TEST_F(DatabaseTest, CommitIsIdempotent) {
	Index items = db->addIndex<Item>("items", "name");
	items.add(item("a"));
	items.add(item("b"));

	// root, index and 2 items
	EXPECT_EQ(db->commit(), 4u);
	EXPECT_EQ(db->commit(), 0u);
	EXPECT_EQ(db->pendingCount(), 0u);
}

TEST_F(DatabaseTest, CascadingSave) {
	// top -> a -> (b, c), top -> d -> e
	const Object b = db->create<Node>(Node{"/nodes/b", "b", entt::null, {}}).entity();
	const Object c = db->create<Node>(Node{"/nodes/c", "c", entt::null, {}}).entity();
	const Object e = db->create<Node>(Node{"/nodes/e", "e", entt::null, {}}).entity();
	const Object a = db->create<Node>(Node{"/nodes/a", "a", entt::null, {b, c}}).entity();
	const Object d = db->create<Node>(Node{"/nodes/d", "d", entt::null, {e}}).entity();
	const Object top = db->create<Node>(Node{"/nodes/top", "top", entt::null, {a, d}}).entity();

	db->registerObject(top);
	EXPECT_EQ(db->commit(), 6u);
	EXPECT_EQ(countRecords(dir), 6u);

	for (const Object o : {top, a, b, c, d, e}) {
		EXPECT_EQ(db->lifecycle(o), ObjectState::CLEAN);
		EXPECT_TRUE(db->storage().exists(db->oidOf(o)));
	}
}

TEST_F(DatabaseTest, SelfReference) {
	ObjectHandle self = db->create<Node>(Node{"/nodes/self", "self", entt::null, {}});
	self.get<Node>().parent = self.entity();
	db->registerObject(self.entity());
	EXPECT_EQ(db->commit(), 1u);

	reopen();
	const Object loaded = db->getByID("/nodes/self").entity();
	EXPECT_EQ(db->state<Node>(loaded).parent, loaded);
	EXPECT_EQ(db->lifecycle(loaded), ObjectState::CLEAN);
}

TEST_F(DatabaseTest, CyclicReferences) {
	ObjectHandle a = db->create<Node>(Node{"/nodes/a", "a", entt::null, {}});
	ObjectHandle b = db->create<Node>(Node{"/nodes/b", "b", a.entity(), {}});
	a.get<Node>().children.push_back(b.entity());

	db->registerObject(a.entity());
	EXPECT_EQ(db->commit(), 2u);

	reopen();
	const Object la = db->getByID("/nodes/a").entity();
	const Object lb = db->state<Node>(la).children.at(0);
	EXPECT_EQ(db->state<Node>(lb).parent, la);
	EXPECT_EQ(db->getByID("/nodes/b").entity(), lb);
}

TEST_F(DatabaseTest, ReopenScenario) {
	{
		Index items = db->addIndex<Item>("items", "name");
		items.add(item("b"));
		items.add(item("a"));
		items.add(item("c"));
		db->commit();
	}

	reopen();
	Index items = db->index("items");
	EXPECT_EQ(items.keys("a", "b"), (std::vector<std::string>{"a", "b"}));

	const Object a1 = db->getByID("/items/a").entity();
	const Object a2 = db->getByID("/items/a").entity();
	EXPECT_EQ(a1, a2);
	EXPECT_EQ(items.get("a"), a1);
	EXPECT_EQ(db->state<Item>(a1).name, "a");
}

TEST_F(DatabaseTest, OrphanBlobsAreKept) {
	Index items = db->addIndex<Item>("items", "name");
	const Object a = item("a");
	items.add(a);
	db->commit();

	const std::string oid = db->oidOf(a);
	items.remove(a);
	EXPECT_EQ(db->commit(), 1u); // only the index

	EXPECT_TRUE(db->storage().exists(oid));

	reopen();
	EXPECT_FALSE(db->index("items").contains("a"));
	EXPECT_EQ(db->state<Item>(db->getByID("/items/a").entity()).name, "a");
}

TEST_F(DatabaseTest, DomainIDChangeIsCaught) {
	const Object a = item("a");
	db->registerObject(a);
	db->commit();

	db->modify<Item>(a).id = "/items/moved";
	EXPECT_THROW(db->commit(), InvariantViolation);
	EXPECT_THROW(db->registerObject(a), InvariantViolation);
}

TEST_F(DatabaseTest, SecondInstanceIsRejected) {
	db->registerObject(item("a"));
	db->commit();

	reopen();
	const Object loaded = db->getByID("/items/a").entity();
	const Object duplicate = item("a");

	EXPECT_THROW(db->registerObject(duplicate), InvariantViolation);
	EXPECT_EQ(db->getByID("/items/a").entity(), loaded);

	// the refused object got no identity
	EXPECT_EQ(db->lifecycle(duplicate), ObjectState::UNSAVED);
	EXPECT_TRUE(db->oidOf(duplicate).empty());
}

TEST_F(DatabaseTest, Singletons) {
	const Object memo = db->create<Note>(Note{"project wide"}).entity();
	db->add(memo, "project");
	EXPECT_EQ(db->oidOf(memo), "project");
	EXPECT_THROW(db->add(db->create<Note>(Note{"again"}).entity(), "project"), InvariantViolation);

	// '@' names would collide with record markers
	const Object reserved = db->create<Note>(Note{"reserved"}).entity();
	EXPECT_THROW(db->add(reserved, "@project"), InvariantViolation);
	EXPECT_EQ(db->lifecycle(reserved), ObjectState::UNSAVED);
	EXPECT_THROW(db->addIndex<Item>("@items", "name"), InvariantViolation);
	db->commit();

	// short names are stored flat, and readable
	EXPECT_TRUE(std::filesystem::is_regular_file(dir.path / "project"));
	EXPECT_FALSE(isZSTDFile(dir.path / "project"));

	reopen();
	EXPECT_EQ(db->state<Note>(db->get("project").entity()).text, "project wide");
}

TEST_F(DatabaseTest, CompressionFollowsTypeAndConfig) {
	const Object a = item("a");
	db->registerObject(a);
	db->addIndex<Item>("items", "name").add(a);
	db->commit();

	EXPECT_TRUE(isZSTDFile(db->storage().pathFor(hashID("/items/a"))));
	EXPECT_FALSE(isZSTDFile(dir.path / "items-index"));
	EXPECT_FALSE(isZSTDFile(dir.path / "root"));

	DatabaseConfig conf = testConfig(dir);
	conf.compress = false;
	reopen(conf);
	db->registerObject(item("b"));
	db->commit();
	EXPECT_FALSE(isZSTDFile(db->storage().pathFor(hashID("/items/b"))));

	// mixed directories read fine
	EXPECT_EQ(db->state<Item>(db->getByID("/items/a").entity()).name, "a");
}

TEST_F(DatabaseTest, Clear) {
	Index items = db->addIndex<Item>("items", "name");
	const Object a = item("a");
	items.add(a);
	db->commit();

	db->clear();
	EXPECT_FALSE(db->registry().valid(a));
	EXPECT_TRUE(db->rootEntries().empty());
	EXPECT_EQ(db->cache().size(), 1u); // the new root

	EXPECT_EQ(db->commit(), 1u);

	reopen();
	EXPECT_THROW(db->index("items"), NotFound);
	// blobs stay
	EXPECT_EQ(db->state<Item>(db->getByID("/items/a").entity()).name, "a");
}

TEST_F(DatabaseTest, RemoveRootObject) {
	db->addIndex<Item>("items", "name");
	db->addIndex<Node>("nodes", "label");
	db->commit();

	db->removeRootObject("items");
	EXPECT_THROW(db->index("items"), NotFound);
	EXPECT_THROW(db->removeRootObject("items"), NotFound);
	db->commit();

	reopen();
	EXPECT_THROW(db->index("items"), NotFound);
	EXPECT_NO_THROW(db->index("nodes"));
}

TEST_F(DatabaseTest, RemoveFromCache) {
	db->registerObject(item("a"));
	db->commit();

	reopen();
	const Object first = db->getByID("/items/a").entity();
	db->removeFromCache(first);
	EXPECT_TRUE(db->getCached(hashID("/items/a")) == entt::null);

	const Object second = db->getByID("/items/a").entity();
	EXPECT_NE(first, second);
	EXPECT_EQ(db->state<Item>(second).name, "a");
}

TEST_F(DatabaseTest, PersistAndLoadFromPath) {
	db->types().registerType<Memo>("renku.test.Memo");

	const Object note = db->create<Note>(Note{"exported"}).entity();
	db->registerObject(note);
	const std::string oid = db->oidOf(note);

	const auto path = dir.path / "exports" / "note.json";
	db->persistToPath(note, path);
	ASSERT_TRUE(std::filesystem::is_regular_file(path));

	const ObjectHandle imported = db->getFromPath(path);
	EXPECT_EQ(imported.get<Note>().text, "exported");
	EXPECT_EQ(db->oidOf(imported.entity()), oid);
	EXPECT_NE(imported.entity(), note);

	const ObjectHandle retagged = db->getFromPath(path, "renku.test.Memo");
	EXPECT_EQ(db->typeOf(retagged.entity()), "renku.test.Memo");
	EXPECT_EQ(retagged.get<Memo>().text, "exported");

	EXPECT_THROW(db->getFromPath(path, "os.system"), DisallowedType);
	EXPECT_THROW(db->getFromPath(dir.path / "missing.json"), NotFound);
}

TEST_F(DatabaseTest, ExpiredValuesAreSwept) {
	{
		ObjectHandle h = db->create<Record>();
		auto& rec = h.get<Record>();
		rec.id = "/records/1";
		rec.creator = std::make_shared<const Person>(Person{"/persons/a", "A", "a@example.com"});
		db->registerObject(h.entity());
		db->commit();
	}

	reopen();
	const Object rec = db->getByID("/records/1").entity();
	EXPECT_EQ(db->reader()._values.size(), 1u);

	// the last holder lets go, the next commit drops the entry
	db->modify<Record>(rec).creator.reset();
	db->commit();
	EXPECT_EQ(db->reader()._values.size(), 0u);
}

TEST_F(DatabaseTest, ForeignObjectsAreRejected) {
	TempDir other_dir{"database_other"};
	Database other{testConfig(other_dir)};
	registerTestTypes(other.types());

	// only validity is checked, so the foreign id has to be out of range for db
	for (int i = 0; i < 8; i++) {
		other.create<Note>(Note{"n"});
	}
	const Object foreign = other.create<Note>(Note{"foreign"}).entity();

	EXPECT_THROW(db->registerObject(foreign), InvariantViolation);
	EXPECT_THROW(db->state<Note>(foreign), InvariantViolation);
}

TEST_F(DatabaseTest, WrongStateTypeIsRejected) {
	const Object a = item("a");
	EXPECT_THROW(db->state<Node>(a), InvariantViolation);
	EXPECT_THROW(db->modify<Note>(a), InvariantViolation);
}

} // namespace
