#include <gtest/gtest.h>
#include "git/Repository.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "support/Errors.hpp"
#include "support/RepoBuilder.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace gm::git;
using namespace gm::types;
using gm::test::RepoBuilder;
using gm::test::kindOf;

namespace {

std::string text(const Object& obj) { return {obj.payload.begin(), obj.payload.end()}; }

}

TEST(RepositoryTest, OpensWorkingTreeAndBareLayouts) {
    RepoBuilder work;
    const auto a = work.blob("work");
    EXPECT_EQ(text(Repository(work.root()).getObject(a)), "work");
    EXPECT_EQ(text(Repository(work.gitDir()).getObject(a)), "work");

    RepoBuilder bare(true);
    const auto b = bare.blob("bare");
    EXPECT_EQ(text(Repository(bare.root()).getObject(b)), "bare");
}

TEST(RepositoryTest, FollowsGitdirFile) {
    RepoBuilder repo;
    const auto id = repo.blob("linked");
    const auto linked = repo.root() / "linked";
    std::filesystem::create_directories(linked);
    gm::util::writeFile(linked / ".git", "gitdir: ../.git\n");

    EXPECT_EQ(text(Repository(linked).getObject(id)), "linked");
}

TEST(RepositoryTest, RejectsMissingAndPlainDirectories) {
    RepoBuilder repo;
    const auto plain = repo.root() / "plain";
    std::filesystem::create_directories(plain);

    // A directory inside a work tree is not itself a repository
    EXPECT_EQ(kindOf([&] { const Repository r(plain); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { const Repository r(repo.root() / "missing"); }), ErrorKind::NotFound);
}

TEST(RepositoryTest, ReadsLooseObjects) {
    RepoBuilder builder;
    const auto id = builder.blob("hello");
    EXPECT_EQ(toHex(id), "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0");

    const Repository repo(builder.root());
    const auto obj = repo.getObject(id);
    EXPECT_EQ(obj.kind, ObjectKind::Blob);
    EXPECT_EQ(text(obj), "hello");

    const auto info = repo.stat(id);
    EXPECT_EQ(info.kind, ObjectKind::Blob);
    EXPECT_EQ(info.size, 5u);
    EXPECT_TRUE(repo.hasObject(id));
}

TEST(RepositoryTest, UnknownObjectIsNotFound) {
    RepoBuilder builder;
    const Repository repo(builder.root());
    const auto missing = RepoBuilder::objectId(ObjectKind::Blob, "never written");

    EXPECT_FALSE(repo.hasObject(missing));
    EXPECT_EQ(kindOf([&] { (void)repo.getObject(missing); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)repo.stat(missing); }), ErrorKind::NotFound);
}

TEST(RepositoryTest, HashMismatchOnlyDetectedWhenVerifying) {
    RepoBuilder builder;
    const auto claimed = RepoBuilder::objectId(ObjectKind::Blob, "original");
    builder.looseAs(claimed, builder.blob("tampered"));

    const Repository trusting(builder.root());
    EXPECT_EQ(text(trusting.getObject(claimed)), "tampered");

    const Repository verifying(builder.root(), true);
    EXPECT_EQ(kindOf([&] { (void)verifying.getObject(claimed); }), ErrorKind::StoreCorruption);
}

TEST(RepositoryTest, UndecodableLooseObjectIsCorruption) {
    RepoBuilder builder;
    const auto id = RepoBuilder::objectId(ObjectKind::Blob, "x");
    builder.looseBytes(id, "not zlib data");

    const Repository repo(builder.root());
    EXPECT_EQ(kindOf([&] { (void)repo.getObject(id); }), ErrorKind::StoreCorruption);
}

TEST(RepositoryTest, ReadsPackedObjects) {
    RepoBuilder builder;
    const std::string base = "line one\nline two\nline three\n";
    const std::string v2 = base + "line four\n";
    const std::string v3 = v2 + "line five\n";

    const auto a = builder.blob(base);
    const auto b = builder.blob(v2);
    const auto c = builder.blob(v3);
    const auto t = builder.tree({{MODE_FILE, "a", a}, {MODE_FILE, "b", b}, {MODE_FILE, "c", c}});
    builder.pack({a, b, c, t});

    const Repository repo(builder.root(), true);
    EXPECT_EQ(text(repo.getObject(a)), base);
    EXPECT_EQ(text(repo.getObject(b)), v2);
    EXPECT_EQ(text(repo.getObject(c)), v3);
    EXPECT_EQ(repo.getObject(t).kind, ObjectKind::Tree);

    const auto info = repo.stat(c);
    EXPECT_EQ(info.kind, ObjectKind::Blob);
    EXPECT_EQ(info.size, v3.size());
    EXPECT_TRUE(repo.hasObject(c));
}

TEST(RepositoryTest, IgnoresIndexWithoutPack) {
    RepoBuilder builder;
    const auto loose = builder.blob("still readable");
    gm::util::writeFile(builder.gitDir() / "objects" / "pack" / "pack-broken.idx", std::string("garbage"));

    const Repository repo(builder.root());
    EXPECT_EQ(text(repo.getObject(loose)), "still readable");
}

TEST(RepositoryTest, CorruptFanoutFailsOnlyTheLookup) {
    RepoBuilder builder;
    const auto packed = builder.blob("packed");
    const auto idx = builder.pack({packed});
    const auto loose = builder.blob("loose");

    // Fanout entry 0x20 claims far more objects than the index holds
    auto bytes = gm::util::readFileToVector(idx);
    const std::size_t at = 8 + 4 * 0x20;
    ASSERT_GT(bytes.size(), at + 4);
    const uint32_t bogus = 50'000'000;
    bytes[at] = static_cast<uint8_t>(bogus >> 24);
    bytes[at + 1] = static_cast<uint8_t>(bogus >> 16);
    bytes[at + 2] = static_cast<uint8_t>(bogus >> 8);
    bytes[at + 3] = static_cast<uint8_t>(bogus);
    std::filesystem::permissions(idx, std::filesystem::perms::owner_write, std::filesystem::perm_options::add);
    gm::util::writeFile(idx, bytes);

    const Repository repo(builder.root());
    const auto kind = kindOf([&] { (void)repo.getObject(packed); });
    EXPECT_TRUE(kind == ErrorKind::NotFound || kind == ErrorKind::StoreCorruption) << to_string(kind);
    EXPECT_FALSE(repo.hasObject(packed));

    EXPECT_EQ(text(repo.getObject(loose)), "loose");
}

TEST(RepositoryTest, RefDeltaCycleAcrossPacksIsCorruption) {
    RepoBuilder builder;
    const std::string x = "shared prefix, object x";
    const std::string y = "shared prefix, object y";
    const auto idX = RepoBuilder::objectId(ObjectKind::Blob, x);
    const auto idY = RepoBuilder::objectId(ObjectKind::Blob, y);

    // Each pack stores its object as a delta against the object in the other
    builder.rawPack("pack-a", {{ObjectKind::Blob, x, idY, y}});
    builder.rawPack("pack-b", {{ObjectKind::Blob, y, idX, x}});
    const auto plain = builder.blob("plain");

    const Repository repo(builder.root());
    EXPECT_EQ(kindOf([&] { (void)repo.getObject(idX); }), ErrorKind::StoreCorruption);
    EXPECT_EQ(kindOf([&] { (void)repo.getObject(idY); }), ErrorKind::StoreCorruption);
    EXPECT_EQ(kindOf([&] { (void)repo.stat(idX); }), ErrorKind::StoreCorruption);

    EXPECT_EQ(text(repo.getObject(plain)), "plain");
}

TEST(RepositoryTest, ResolvesLooseSymbolicAndPackedRefs) {
    RepoBuilder builder;
    const auto a = builder.blob("a");
    const auto b = builder.blob("b");
    builder.ref("refs/heads/main", a);
    builder.packedRefs({{"refs/heads/feature", b}, {"refs/heads/main", b}});

    const Repository repo(builder.root());
    // The loose file wins over packed-refs
    EXPECT_EQ(repo.resolveRef("refs/heads/main"), a);
    EXPECT_EQ(repo.resolveRef("HEAD"), a);
    EXPECT_EQ(repo.resolveRef("refs/heads/feature"), b);
}

TEST(RepositoryTest, SymbolicRefLoopIsCorruption) {
    RepoBuilder builder;
    builder.symref("refs/heads/a", "refs/heads/b");
    builder.symref("refs/heads/b", "refs/heads/a");

    const Repository repo(builder.root());
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef("refs/heads/a"); }), ErrorKind::StoreCorruption);
}

TEST(RepositoryTest, MissingOrInvalidRefIsNotFound) {
    RepoBuilder builder;
    const Repository repo(builder.root());

    // HEAD points at an unborn branch
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef("HEAD"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef("refs/heads/../../etc"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef("/etc/passwd"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef("config"); }), ErrorKind::NotFound);
    EXPECT_EQ(kindOf([&] { (void)repo.resolveRef(""); }), ErrorKind::NotFound);
}

TEST(RepositoryTest, ConcurrentReadersShareOneRepository) {
    RepoBuilder builder;
    std::vector<Oid> ids;
    for (int i = 0; i < 32; ++i) ids.push_back(builder.blob("object " + std::to_string(i)));

    const Repository repo(builder.root());
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int round = 0; round < 20; ++round) {
                const auto i = static_cast<std::size_t>((t + round) % 32);
                if (text(repo.getObject(ids[i])) != "object " + std::to_string(i)) ++mismatches;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(mismatches.load(), 0);
}
