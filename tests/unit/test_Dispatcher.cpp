#include <gtest/gtest.h>
#include "fuse/Dispatcher.hpp"
#include "fs/Session.hpp"
#include "support/Errors.hpp"
#include "support/RepoBuilder.hpp"

#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <string>
#include <unistd.h>

using namespace gm::fuse;
using namespace gm::fs;
using namespace gm::git;
using namespace gm::types;
using gm::test::RepoBuilder;
using gm::test::kindOf;
using gm::fs::cache::ROOT_INODE;

namespace {

constexpr std::time_t COMMIT_TIME = 1700000123;

template<typename T>
T expectReply(const Reply& result) {
    if (const auto* err = std::get_if<reply::Error>(&result)) {
        ADD_FAILURE() << "unexpected error reply: " << err->message;
        return T{};
    }
    EXPECT_TRUE(std::holds_alternative<T>(result));
    return std::holds_alternative<T>(result) ? std::get<T>(result) : T{};
}

std::string text(const reply::Data& data) { return {data.bytes.begin(), data.bytes.end()}; }

}

class DispatcherTest : public ::testing::Test {
protected:
    RepoBuilder builder;
    std::unique_ptr<Session> session;
    std::unique_ptr<Dispatcher> dispatcher;

    void SetUp() override {
        const auto bin = builder.tree({{MODE_EXECUTABLE, "run.sh", builder.blob("#!/bin/sh\necho hi\n")}});
        const auto root = builder.tree({
            {MODE_FILE, "file.txt", builder.blob("hello")},
            {MODE_TREE, "bin", bin},
            {MODE_SYMLINK, "escape", builder.blob("../../outside")},
            {MODE_GITLINK, "vendor", RepoBuilder::objectId(ObjectKind::Commit, "elsewhere")},
        });
        builder.ref("refs/heads/main", builder.commit(root, COMMIT_TIME));

        session = Session::open(builder.root(), "HEAD");
        session->beginMount();
        session->markMounted();
        dispatcher = std::make_unique<Dispatcher>(*session, Dispatcher::Options{60.0, 30.0});
    }

    reply::Entry lookup(const Inode parent, const std::string& name) {
        return expectReply<reply::Entry>(dispatcher->dispatch(request::Lookup{parent, name}));
    }

    int errnoFor(const Request& r) { return errnoOf(dispatcher->dispatch(r)); }
};

TEST_F(DispatcherTest, LookupAndReadFile) {
    const auto entry = lookup(ROOT_INODE, "file.txt");
    EXPECT_NE(entry.ino, ROOT_INODE);
    EXPECT_EQ(entry.attr.st_mode, S_IFREG | 0444);
    EXPECT_EQ(entry.attr.st_size, 5);
    EXPECT_EQ(entry.attr.st_nlink, 1u);
    EXPECT_EQ(entry.attr.st_mtim.tv_sec, COMMIT_TIME);
    EXPECT_EQ(entry.attr.st_uid, ::getuid());
    EXPECT_EQ(entry.attrTimeout, 60.0);
    EXPECT_EQ(entry.entryTimeout, 30.0);

    const auto opened = expectReply<reply::Open>(dispatcher->dispatch(request::Open{entry.ino, O_RDONLY}));
    const auto data = expectReply<reply::Data>(dispatcher->dispatch(request::Read{entry.ino, opened.fh, 0, 4096}));
    EXPECT_EQ(text(data), "hello");

    const auto tail = expectReply<reply::Data>(dispatcher->dispatch(request::Read{entry.ino, opened.fh, 2, 2}));
    EXPECT_EQ(text(tail), "ll");

    const auto past = expectReply<reply::Data>(dispatcher->dispatch(request::Read{entry.ino, opened.fh, 5, 10}));
    EXPECT_TRUE(past.bytes.empty());

    EXPECT_EQ(errnoFor(request::Release{entry.ino, opened.fh}), 0);
    EXPECT_EQ(session->openHandles(), 0u);
    EXPECT_EQ(errnoFor(request::Read{entry.ino, opened.fh, 0, 1}), EBADF);
}

TEST_F(DispatcherTest, ExecutableBitSurvives) {
    const auto bin = lookup(ROOT_INODE, "bin");
    EXPECT_EQ(bin.attr.st_mode, S_IFDIR | 0555);

    const auto run = lookup(bin.ino, "run.sh");
    EXPECT_EQ(run.attr.st_mode, S_IFREG | 0555);
    EXPECT_EQ(errnoFor(request::Access{run.ino, X_OK}), 0);

    const auto file = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(errnoFor(request::Access{file.ino, X_OK}), EACCES);
    EXPECT_EQ(errnoFor(request::Access{file.ino, R_OK}), 0);
}

TEST_F(DispatcherTest, LookupErrors) {
    EXPECT_EQ(errnoFor(request::Lookup{ROOT_INODE, "missing"}), ENOENT);
    EXPECT_EQ(errnoFor(request::Lookup{ROOT_INODE, "a/b"}), EINVAL);
    EXPECT_EQ(errnoFor(request::Lookup{ROOT_INODE, ""}), EINVAL);
    EXPECT_EQ(errnoFor(request::Lookup{9999, "file.txt"}), ESTALE);

    const auto file = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(errnoFor(request::Lookup{file.ino, "child"}), ENOTDIR);
}

TEST_F(DispatcherTest, RepeatedLookupsReuseInodeAndCount) {
    const auto a = lookup(ROOT_INODE, "file.txt");
    const auto b = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(a.ino, b.ino);
    EXPECT_EQ(session->inodes().lookupCount(a.ino), 2u);

    EXPECT_EQ(errnoFor(request::Forget{a.ino, 2}), 0);
    EXPECT_EQ(session->inodes().lookupCount(a.ino), 0u);

    // Still answerable after forget
    EXPECT_EQ(errnoFor(request::GetAttr{a.ino}), 0);
}

TEST_F(DispatcherTest, ReadDirListsDotEntriesThenChildren) {
    const auto dir = expectReply<reply::Directory>(dispatcher->dispatch(request::ReadDir{ROOT_INODE}));
    ASSERT_EQ(dir.entries.size(), 6u);
    EXPECT_EQ(dir.entries[0].name, ".");
    EXPECT_EQ(dir.entries[0].ino, ROOT_INODE);
    EXPECT_EQ(dir.entries[1].name, "..");
    EXPECT_EQ(dir.entries[1].ino, ROOT_INODE);
    EXPECT_EQ(dir.entries[2].name, "bin");
    EXPECT_EQ(dir.entries[2].type, S_IFDIR);
    EXPECT_EQ(dir.entries[3].name, "escape");
    EXPECT_EQ(dir.entries[3].type, S_IFLNK);
    EXPECT_EQ(dir.entries[4].name, "file.txt");
    EXPECT_EQ(dir.entries[4].type, S_IFREG);
    EXPECT_EQ(dir.entries[5].name, "vendor");
    EXPECT_EQ(dir.entries[5].type, S_IFDIR);

    // Inode numbers agree with lookup
    EXPECT_EQ(lookup(ROOT_INODE, "file.txt").ino, dir.entries[4].ino);

    const auto bin = lookup(ROOT_INODE, "bin");
    const auto sub = expectReply<reply::Directory>(dispatcher->dispatch(request::ReadDir{bin.ino}));
    ASSERT_EQ(sub.entries.size(), 3u);
    EXPECT_EQ(sub.entries[1].ino, ROOT_INODE);
    EXPECT_EQ(sub.entries[2].name, "run.sh");

    const auto file = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(errnoFor(request::ReadDir{file.ino}), ENOTDIR);

    // Listing again hands out the same names and inode numbers
    const auto again = expectReply<reply::Directory>(dispatcher->dispatch(request::ReadDir{ROOT_INODE}));
    ASSERT_EQ(again.entries.size(), dir.entries.size());
    for (std::size_t i = 0; i < dir.entries.size(); ++i) {
        EXPECT_EQ(again.entries[i].name, dir.entries[i].name);
        EXPECT_EQ(again.entries[i].ino, dir.entries[i].ino) << dir.entries[i].name;
        EXPECT_EQ(again.entries[i].type, dir.entries[i].type) << dir.entries[i].name;
    }
}

TEST_F(DispatcherTest, SubmoduleIsEmptyDirectory) {
    const auto vendor = lookup(ROOT_INODE, "vendor");
    EXPECT_EQ(vendor.attr.st_mode, S_IFDIR | 0555);

    const auto dir = expectReply<reply::Directory>(dispatcher->dispatch(request::ReadDir{vendor.ino}));
    EXPECT_EQ(dir.entries.size(), 2u);
}

TEST_F(DispatcherTest, SymlinkTargetIsVerbatim) {
    const auto link = lookup(ROOT_INODE, "escape");
    EXPECT_EQ(link.attr.st_mode, S_IFLNK | 0555);
    EXPECT_EQ(link.attr.st_size, 13);

    const auto target = expectReply<reply::Link>(dispatcher->dispatch(request::ReadLink{link.ino}));
    EXPECT_EQ(target.target, "../../outside");

    const auto file = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(errnoFor(request::ReadLink{file.ino}), EINVAL);
}

TEST_F(DispatcherTest, OpenRejectsWriteIntentAndDirectories) {
    const auto file = lookup(ROOT_INODE, "file.txt");
    EXPECT_EQ(errnoFor(request::Open{file.ino, O_WRONLY}), EACCES);
    EXPECT_EQ(errnoFor(request::Open{file.ino, O_RDWR}), EACCES);
    EXPECT_EQ(errnoFor(request::Open{file.ino, O_RDONLY | O_TRUNC}), EACCES);
    EXPECT_EQ(errnoFor(request::Open{file.ino, O_RDONLY | O_APPEND}), EACCES);

    EXPECT_EQ(errnoFor(request::Open{ROOT_INODE, O_RDONLY}), EISDIR);
    EXPECT_EQ(session->openHandles(), 0u);
}

TEST_F(DispatcherTest, ModificationsAreRejected) {
    const auto file = lookup(ROOT_INODE, "file.txt");

    for (const auto op : {request::WriteOp::SetAttr, request::WriteOp::MkDir, request::WriteOp::Unlink,
                          request::WriteOp::Rename, request::WriteOp::Write, request::WriteOp::Create,
                          request::WriteOp::SetXAttr}) {
        const auto result = dispatcher->dispatch(request::Modify{op, file.ino, "x"});
        ASSERT_TRUE(std::holds_alternative<reply::Error>(result)) << to_string(op);
        EXPECT_EQ(std::get<reply::Error>(result).kind, ErrorKind::PermissionDenied);
    }

    EXPECT_EQ(errnoFor(request::Access{file.ino, W_OK}), EACCES);

    // Nothing changed
    const auto again = expectReply<reply::Attr>(dispatcher->dispatch(request::GetAttr{file.ino}));
    EXPECT_EQ(again.attr.st_size, 5);
}

TEST_F(DispatcherTest, StatFsReportsReadOnly) {
    const auto stats = expectReply<reply::StatFs>(dispatcher->dispatch(request::StatFs{ROOT_INODE}));
    EXPECT_EQ(stats.st.f_bsize, 4096u);
    EXPECT_EQ(stats.st.f_namemax, 255u);
    EXPECT_TRUE(stats.st.f_flag & ST_RDONLY);
    EXPECT_GE(stats.st.f_files, 1u);
}

TEST_F(DispatcherTest, RequestsAfterUnmountAreRefused) {
    session->beginUnmount();
    EXPECT_EQ(errnoFor(request::GetAttr{ROOT_INODE}), ENOTCONN);
    session->markUnmounted();

    const auto result = dispatcher->dispatch(request::Lookup{ROOT_INODE, "file.txt"});
    ASSERT_TRUE(std::holds_alternative<reply::Error>(result));
    EXPECT_EQ(std::get<reply::Error>(result).kind, ErrorKind::NotMounted);
}

TEST(DispatcherCorruptionTest, UndecodableEntryFailsWithEioOnly) {
    RepoBuilder builder;
    const auto broken = RepoBuilder::objectId(ObjectKind::Blob, "broken");
    builder.looseBytes(broken, "not zlib data");
    const auto blobAsTree = builder.blob("not a tree");

    const auto root = builder.tree({
        {MODE_FILE, "file.txt", builder.blob("hello")},
        {MODE_FILE, "broken", broken},
        {MODE_TREE, "notatree", blobAsTree},
    });
    builder.ref("refs/heads/main", builder.commit(root, COMMIT_TIME));

    const auto session = Session::open(builder.root(), "HEAD");
    session->beginMount();
    session->markMounted();
    Dispatcher dispatcher(*session, Dispatcher::Options{1.0, 1.0});

    // The size of a file comes from its object header, so the lookup already fails
    EXPECT_EQ(errnoOf(dispatcher.dispatch(request::Lookup{ROOT_INODE, "broken"})), EIO);

    const auto notATree = expectReply<reply::Entry>(dispatcher.dispatch(request::Lookup{ROOT_INODE, "notatree"}));
    EXPECT_EQ(errnoOf(dispatcher.dispatch(request::ReadDir{notATree.ino})), EIO);
    EXPECT_EQ(errnoOf(dispatcher.dispatch(request::Lookup{notATree.ino, "x"})), EIO);

    // Healthy siblings are unaffected
    const auto file = expectReply<reply::Entry>(dispatcher.dispatch(request::Lookup{ROOT_INODE, "file.txt"}));
    const auto opened = expectReply<reply::Open>(dispatcher.dispatch(request::Open{file.ino, O_RDONLY}));
    const auto data = expectReply<reply::Data>(dispatcher.dispatch(request::Read{file.ino, opened.fh, 0, 4096}));
    EXPECT_EQ(text(data), "hello");
    EXPECT_EQ(errnoOf(dispatcher.dispatch(request::Release{file.ino, opened.fh})), 0);
    EXPECT_TRUE(session->isMounted());
}

TEST(SessionTest, UnknownReferenceIsMountFailure) {
    RepoBuilder builder;
    builder.ref("refs/heads/main", builder.commit(builder.tree({})));

    EXPECT_EQ(kindOf([&] { (void)Session::open(builder.root(), "no-such-branch"); }), ErrorKind::MountFailure);
    EXPECT_EQ(kindOf([&] { (void)Session::open(builder.root() / "nowhere", "HEAD"); }), ErrorKind::MountFailure);
}

TEST(SessionTest, StateMachine) {
    RepoBuilder builder;
    builder.ref("refs/heads/main", builder.commit(builder.tree({})));
    const auto session = Session::open(builder.root(), "main");

    EXPECT_EQ(session->state(), MountState::Unmounted);
    EXPECT_EQ(kindOf([&] { session->markMounted(); }), ErrorKind::NotMounted);

    session->beginMount();
    EXPECT_EQ(kindOf([&] { session->beginMount(); }), ErrorKind::MountFailure);
    session->abortMount();
    EXPECT_EQ(session->state(), MountState::Unmounted);

    session->beginMount();
    session->markMounted();
    EXPECT_TRUE(session->isMounted());
    session->beginUnmount();
    session->markUnmounted();
    EXPECT_EQ(to_string(session->state()), "unmounted");
}

TEST(SessionTest, HandleTable) {
    RepoBuilder builder;
    const auto blob = builder.blob("data");
    builder.ref("refs/heads/main", builder.commit(builder.tree({{MODE_FILE, "f", blob}})));
    const auto session = Session::open(builder.root(), "HEAD");

    const auto fh = session->addHandle(session->blobs().open(blob));
    EXPECT_EQ(fh, 1u);
    EXPECT_EQ(session->handle(fh).totalSize, 4u);
    EXPECT_EQ(session->openHandles(), 1u);

    auto taken = session->takeHandle(fh);
    session->blobs().close(taken);
    EXPECT_EQ(kindOf([&] { (void)session->handle(fh); }), ErrorKind::BadHandle);
    EXPECT_EQ(kindOf([&] { (void)session->takeHandle(fh); }), ErrorKind::BadHandle);
}
