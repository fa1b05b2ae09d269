#pragma once

namespace gm::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
