#pragma once

namespace ib::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
