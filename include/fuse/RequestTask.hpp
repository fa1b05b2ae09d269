#pragma once

#define FUSE_USE_VERSION 35

#include "concurrency/Task.hpp"

#include <cstdlib>
#include <fuse_lowlevel.h>

namespace gm::fuse {

// One kernel request, processed on a pool worker. Owns the receive buffer.
class RequestTask : public concurrency::Task {
public:
    RequestTask(fuse_session* session, const fuse_buf& buf) : session_(session), buf_(buf) {}

    ~RequestTask() override {
        if (!(buf_.flags & FUSE_BUF_IS_FD)) std::free(buf_.mem);
    }

    RequestTask(const RequestTask&) = delete;
    RequestTask& operator=(const RequestTask&) = delete;

    void operator()() override { fuse_session_process_buf(session_, &buf_); }

private:
    fuse_session* session_;
    fuse_buf buf_;
};

}
