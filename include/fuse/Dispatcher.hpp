#pragma once

#include "fs/Session.hpp"
#include "fuse/Request.hpp"

namespace gm::fuse {

// Answers one filesystem request against a mounted session. Every failure is
// turned into an error reply; nothing thrown inside a handler escapes.
class Dispatcher {
public:
    struct Options {
        double attrTimeout = 3600.0;
        double entryTimeout = 3600.0;
    };

    explicit Dispatcher(fs::Session& session) : Dispatcher(session, Options{}) {}
    Dispatcher(fs::Session& session, Options options);

    [[nodiscard]] Reply dispatch(const Request& request);

    [[nodiscard]] fs::Session& session() noexcept { return session_; }

private:
    fs::Session& session_;
    Options options_;

    reply::Entry handle(const request::Lookup& r);
    reply::Attr handle(const request::GetAttr& r);
    reply::Directory handle(const request::ReadDir& r);
    reply::Open handle(const request::Open& r);
    reply::Data handle(const request::Read& r);
    reply::Link handle(const request::ReadLink& r);
    reply::Empty handle(const request::Release& r);
    reply::Empty handle(const request::Access& r);
    reply::Empty handle(const request::Forget& r);
    reply::StatFs handle(const request::StatFs& r);
    reply::Empty handle(const request::Modify& r);

    [[nodiscard]] struct stat attrFor(Inode ino, const fs::model::PathNode& node) const;
    [[nodiscard]] fs::model::PathNode nodeFor(Inode ino) const;
};

}
