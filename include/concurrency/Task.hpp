#pragma once

namespace bh::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
