#pragma once

namespace pfs::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
