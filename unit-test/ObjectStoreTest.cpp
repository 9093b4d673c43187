#include <cstdlib>
#include <ctime>
#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "store/digest.hpp"
#include "store/filesystem_backend.hpp"
#include "store/maintenance.hpp"
#include "store/memory_backend.hpp"
#include "store/object_store.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;
using namespace grader::store;

/**
 * @brief 固定引用一组对象的引用来源
 */
struct fixed_references : public reference_source {
    set<string> digests;

    string name() const override {
        return "fixed";
    }

    void enumerate(set<string> &result) override {
        result.insert(digests.begin(), digests.end());
    }
};

class ObjectStoreTest : public ::testing::Test {
protected:
    memory_backend *durable = nullptr;
    memory_backend *cache = nullptr;
    unique_ptr<object_store> objects;

    void SetUp() override {
        auto d = make_unique<memory_backend>();
        auto c = make_unique<memory_backend>();
        durable = d.get();
        cache = c.get();
        objects = make_unique<object_store>(move(d), move(c));
    }
};

TEST_F(ObjectStoreTest, DigestTest) {
    EXPECT_EQ(compute_digest("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(compute_digest(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(compute_digest("The quick brown fox jumps over the lazy dog"), "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
    EXPECT_TRUE(is_valid_digest(compute_digest(string(1000, 'x'))));
    EXPECT_TRUE(is_valid_digest("a9993e364706816aba3e25717850c26c9cd0d89d"));
    EXPECT_FALSE(is_valid_digest("A9993E364706816ABA3E25717850C26C9CD0D89D"));
    EXPECT_FALSE(is_valid_digest("../etc/passwd"));
    EXPECT_FALSE(is_valid_digest(""));
}

TEST_F(ObjectStoreTest, DeduplicationTest) {
    size_t before = objects->size();
    string first = objects->put("hello world");
    string second = objects->put("hello world");
    EXPECT_EQ(first, second);
    EXPECT_EQ(objects->size(), before + 1);
    EXPECT_EQ(objects->get(first), "hello world");
    EXPECT_TRUE(objects->contains(first));
}

TEST_F(ObjectStoreTest, MissingObjectTest) {
    EXPECT_THROW(objects->get(compute_digest("missing")), store_error);
    EXPECT_THROW(objects->get("not a digest"), store_error);
    EXPECT_FALSE(objects->contains("not a digest"));
}

TEST_F(ObjectStoreTest, CorruptedObjectTest) {
    string digest = objects->put("original");
    objects->remove_from_cache(digest);
    durable->overwrite(digest, "tampered");

    EXPECT_THROW(objects->get(digest), corrupted_object_error);
    EXPECT_FALSE(cache->contains(digest));
}

TEST_F(ObjectStoreTest, CorruptedCacheFallsThroughTest) {
    string digest = objects->put("original");
    cache->overwrite(digest, "tampered");

    EXPECT_EQ(objects->get(digest), "original");
    // 缓存中的副本被重新写入
    EXPECT_EQ(cache->get(digest), "original");
}

TEST_F(ObjectStoreTest, PrecacheTest) {
    string digest = objects->put("data");
    objects->remove_from_cache(digest);
    EXPECT_FALSE(cache->contains(digest));

    objects->precache(digest);
    EXPECT_TRUE(cache->contains(digest));
}

TEST_F(ObjectStoreTest, GarbageCollectionTest) {
    fixed_references refs;
    string kept = objects->put("kept");
    string orphan = objects->put("orphan");
    refs.digests.insert(kept);

    gc_options options;
    options.dry_run = true;
    options.min_age = chrono::seconds(0);
    auto report = collect_garbage(*durable, {&refs}, options);
    EXPECT_EQ(report.scanned, 2);
    EXPECT_EQ(report.orphans, 1);
    EXPECT_EQ(report.deleted, 0);
    EXPECT_TRUE(durable->contains(orphan));

    options.dry_run = false;
    report = collect_garbage(*durable, {&refs}, options);
    EXPECT_EQ(report.deleted, 1);
    EXPECT_FALSE(durable->contains(orphan));
    EXPECT_TRUE(durable->contains(kept));
}

TEST_F(ObjectStoreTest, GarbageCollectionKeepsYoungObjectsTest) {
    fixed_references refs;
    string orphan = objects->put("young orphan");

    auto report = collect_garbage(*durable, {&refs}, gc_options());
    EXPECT_EQ(report.orphans, 0);
    EXPECT_TRUE(durable->contains(orphan));
}

TEST_F(ObjectStoreTest, VerifyTest) {
    string good = objects->put("good");
    string bad = objects->put("bad");
    durable->overwrite(bad, "worse");

    auto corrupted = verify_objects(*durable, false);
    EXPECT_EQ(corrupted, vector<string>{bad});
    EXPECT_TRUE(durable->contains(bad));

    verify_objects(*durable, true);
    EXPECT_FALSE(durable->contains(bad));
    EXPECT_TRUE(durable->contains(good));
}

TEST_F(ObjectStoreTest, FilesystemBackendTest) {
    path root = temp_directory_path() / "grader-test" / ("store-" + random_id());
    {
        filesystem_backend backend(root);
        string digest = compute_digest("content");
        EXPECT_TRUE(backend.put(digest, "content"));
        EXPECT_FALSE(backend.put(digest, "content"));
        EXPECT_TRUE(exists(backend.path_of(digest)));
        EXPECT_EQ(backend.get(digest), "content");

        // 不是摘要命名的文件会被忽略
        write_file_content(root / "README", "not an object");
        auto objects = backend.list();
        ASSERT_EQ(objects.size(), 1);
        EXPECT_EQ(objects[0].digest, digest);
        EXPECT_EQ(objects[0].size, 7);
        EXPECT_EQ(objects[0].stored_at, grader::last_write_time(backend.path_of(digest)));
        EXPECT_LE(std::abs(objects[0].stored_at - time(nullptr)), 60);

        EXPECT_TRUE(backend.remove(digest));
        EXPECT_FALSE(backend.contains(digest));
        EXPECT_THROW(backend.get(digest), store_error);
        EXPECT_THROW(backend.path_of("../escape"), store_error);
    }
    remove_all(root);
}
